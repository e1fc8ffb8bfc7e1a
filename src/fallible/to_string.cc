#include "to_string.hh"

#include <fallible/utility.hh>

#include <format>

std::string fl::to_string(void const* ptr)
{
    return std::format("{}", ptr);
}

std::string fl::to_string(std::nullptr_t)
{
    return "nullptr";
}

std::string fl::to_string(bool b)
{
    return b ? "true" : "false";
}

std::string fl::to_string(char c)
{
    return std::string(1, c);
}

std::string fl::to_string(signed char i)
{
    return std::format("{}", i);
}

std::string fl::to_string(unsigned char i)
{
    return std::format("{}", i);
}

std::string fl::to_string(signed short i)
{
    return std::format("{}", i);
}

std::string fl::to_string(unsigned short i)
{
    return std::format("{}", i);
}

std::string fl::to_string(signed int i)
{
    return std::format("{}", i);
}

std::string fl::to_string(unsigned int i)
{
    return std::format("{}", i);
}

std::string fl::to_string(signed long i)
{
    return std::format("{}", i);
}

std::string fl::to_string(unsigned long i)
{
    return std::format("{}", i);
}

std::string fl::to_string(signed long long i)
{
    return std::format("{}", i);
}

std::string fl::to_string(unsigned long long i)
{
    return std::format("{}", i);
}

std::string fl::to_string(float f)
{
    return std::format("{}", f);
}

std::string fl::to_string(double f)
{
    return std::format("{}", f);
}

std::string fl::to_string(char const* s)
{
    return s == nullptr ? "nullptr" : std::string(s);
}

std::string fl::to_string(std::string s)
{
    return s;
}

std::string fl::to_string(std::string_view s)
{
    return std::string(s);
}

std::string fl::to_string(unit)
{
    return "()";
}
