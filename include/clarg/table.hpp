#ifndef CLARG_TABLE_HPP
#define CLARG_TABLE_HPP

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "param.hpp"

namespace clarg {

// Declared Flags and Arguments of one parser, in declaration order, indexed by name.
class ParamTable {
public:
    using Entry = std::pair<std::string, Param>;

    ParamTable() = default;

    // Bulk construction from an ordered name -> declaration mapping. A declaration with an empty
    // name takes the key; the first failing entry aborts with its exception.
    static ParamTable buildFromMapping(const std::vector<Entry>& entries);

    // Throws DuplicateNameError or InvalidNameError.
    void declareFlag(const std::string& name, const std::string& helpText = {});

    // Throws DuplicateNameError, InvalidNameError or InvalidArityError.
    void declareArgument(const std::string& name,
                         ValueType type,
                         int arity = 1,
                         bool isSwitch = false,
                         const std::string& helpText = {});

    void declareArgument(const std::string& name,
                         Converter converter,
                         const std::string& typeName,
                         int arity = 1,
                         bool isSwitch = false,
                         const std::string& helpText = {});

    // Adds a declaration built elsewhere, with the same checks as the declare* calls.
    void declare(Param param);

    [[nodiscard]] const Param* find(const std::string& name) const;
    [[nodiscard]] bool contains(const std::string& name) const { return index_.count(name) != 0; }
    [[nodiscard]] const std::vector<Param>& params() const { return params_; }
    [[nodiscard]] std::vector<const Param*> flags() const;
    [[nodiscard]] std::vector<const Param*> arguments() const;
    [[nodiscard]] std::size_t size() const { return params_.size(); }
    [[nodiscard]] bool empty() const { return params_.empty(); }

private:
    std::vector<Param> params_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace clarg

#endif // CLARG_TABLE_HPP
