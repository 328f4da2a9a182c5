#include <exceptions/factory.h>

#include "exception_handler.h"

namespace exceptions
{
std::unique_ptr<exception_handler_if> factory::create_exceptions_handler()
{
    return std::unique_ptr<exception_handler_if>{new exception_handler()};
}
}  // namespace exceptions
