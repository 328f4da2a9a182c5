#include "exception_handler.h"

#include <logging/logger.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

namespace
{
void log_and_abort()
{
    std::cerr << "terminate handler called\n";

    if (std::exception_ptr eptr = std::current_exception())
    {
        try
        {
            std::rethrow_exception(eptr);
        }
        catch (const std::exception& exc)
        {
            LOG(CRITICAL) << "uncaught exception: " << exc.what();
        }
        catch (...)
        {
            LOG(CRITICAL) << "uncaught exception of unknown type";
        }
    }
    else
    {
        LOG(CRITICAL) << "terminate called without an active exception";
    }

    std::abort();// forces abnormal termination
}
}// namespace

namespace exceptions
{
exception_handler::exception_handler() :
    previous_(std::set_terminate(log_and_abort))
{
}

exception_handler::~exception_handler()
{
    std::set_terminate(previous_);
}

}// namespace exceptions
