#ifndef CLARG_CLARG_HPP
#define CLARG_CLARG_HPP

#include "color.hpp"
#include "errors.hpp"
#include "matcher.hpp"
#include "param.hpp"
#include "parser.hpp"
#include "result.hpp"
#include "table.hpp"
#include "utils.hpp"

#endif // CLARG_CLARG_HPP
