#pragma once

#include <exception>
#include <string>
#include <iostream>
#include <cstdlib>

#include "TypeHelpers.hpp"

#include "Exrange_export.h"

namespace ex
{

void EXRANGE_EXPORT enableTraceOnException(bool enable);
bool EXRANGE_EXPORT getEnableTraceOnException();
std::string EXRANGE_EXPORT genStackTrace();

//Base of every exception thrown by Exrange. The stack trace (if enabled) is kept apart from what()
class EXRANGE_EXPORT ExError : public std::exception
{
public:
	explicit ExError(const std::string &msg);
	const char *what() const noexcept override { return msg_.c_str(); }
	const std::string& stacktrace() const { return trace_; }

private:
	std::string msg_;
	std::string trace_;
};

//Indexing a sequence out of its bounds, or from an index that can't be made inclusive
class EXRANGE_EXPORT IndexError : public ExError
{
public:
	using ExError::ExError;
};

//Malformed input while loading a range from an archive. The only error callers are expected to handle
class EXRANGE_EXPORT DecodeError : public ExError
{
public:
	using ExError::ExError;
};

}

// Asserts
#define ex_assert_with_message(expression, msg) do{if((expression) == false) {std::cerr << msg << std::endl; std::abort();}}while(0)
#define ex_assert_no_message(expression) do{if((expression) == false){std::cerr << "Assertion " << #expression << " failed" << std::endl; std::abort();}}while(0)
#define __GetExAssrtyMacro(_1,_2,NAME,...) NAME
//ex_assert is basically C assert but not effected by the NDEBUG flag. Use assert for debug, ex_assert for possible user screw-ups.
#define ex_assert(...) __GetExAssrtyMacro(__VA_ARGS__ ,ex_assert_with_message, ex_assert_no_message, nullptr)(__VA_ARGS__)

// Checks. These are higer level APIs. Which when condition fails, they unwind the stack and throws an excpetion
#define ex_check_with_message(expression, msg) do{if((expression) == false) {throw ex::ExError(msg);}}while(0)
#define ex_check_no_message(expression) do{if((expression) == false){throw ex::ExError(std::string("Check ")+#expression+" failed");}}while(0)
#define __GetExCheckyMacro(_1,_2,NAME,...) NAME
#define ex_check(...) __GetExCheckyMacro(__VA_ARGS__ ,ex_check_with_message, ex_check_no_message, nullptr)(__VA_ARGS__)
