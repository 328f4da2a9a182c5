#ifndef EXCEPTIONS_H
#define EXCEPTIONS_H

#include <stdexcept>
#include <string>

/**
   create a message
   @param[in] message : the exception message
   @param[in] file : file in which the exception occurred
   @param[in] line : line number at which the exception occurred
   @return: A string containing message, file name and line number
*/
std::string make_message(const std::string& message, const std::string& file, int line);

/**
   create an exception
   @param[in] message : the exception message
   @param[in] file : file in which the exception occurred
   @param[in] line : line number at which the exception occurred
   @return: An exception object of type T containing a message, with appended file name and line number
*/
template<typename T>
T make_exception(const std::string& message, const std::string& file, int line)
{
    return T(make_message(message, file, line));
}

/**
    Convenience macro for make_exception
*/
#define make_exception_macro(T, x) make_exception<T>(x, __FILE__, __LINE__)

#endif//EXCEPTIONS_H
