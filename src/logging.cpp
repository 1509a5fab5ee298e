#include "eqv/logging.hpp"


size_t
eqv::logging_indent = 0;

enum eqv::loglevel
eqv::loglevel = eqv::loglevel::warning;
