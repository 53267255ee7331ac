#include "errors.h"

namespace sudoku {

DEFINE_RUNTIME_ERROR(malformed_input_error);
DEFINE_RUNTIME_ERROR(contradictory_givens_error);
DEFINE_RUNTIME_ERROR(config_error);
DEFINE_RUNTIME_ERROR(io_error);

}
