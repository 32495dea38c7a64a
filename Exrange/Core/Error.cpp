#include "Error.hpp"
using namespace ex;

#include <backward.hpp>
using namespace backward;

#include <iostream>
#include <sstream>

static bool g_enable_trace_on_exception = true;

void ex::enableTraceOnException(bool enable)
{
	g_enable_trace_on_exception = enable;
}

bool ex::getEnableTraceOnException()
{
	return g_enable_trace_on_exception;
}

std::string ex::genStackTrace()
{
#ifndef BACKWARD_SYSTEM_UNKNOWN
	std::stringstream ss;
	StackTrace st;
	st.load_here(32);
	Printer p;
	p.color_mode = ColorMode::never;
	p.print(st, ss);
	return ss.str();
#else
	static bool warning_printed = false;
	if(warning_printed == false) {
		warning_printed = true;
		std::cerr << "Warning: Cannot provide stack unwinding support for this system." << std::endl;
	}
	return "";
#endif
}

ExError::ExError(const std::string &msg)
	: msg_(msg)
{
	if(getEnableTraceOnException())
		trace_ = genStackTrace();
}
