#include "TypeHelpers.hpp"

using namespace ex;

#ifdef HAVE_CXA_DEMANGLE //Set by CMake if avaliable

#include <cxxabi.h>
#include <cstdlib>
#include <memory>

std::string ex::demangle(const char* name)
{
	int status = -4;
	std::unique_ptr<char, void(*)(void*)> res(abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free);
	if(status != 0 || res == nullptr)
		return std::string(name);
	return std::string(res.get());
}

#else

#if _MSC_VER
#pragma message ("warning: CXA_DEMANGLE API not avaliable. Type demangling is not enabled. (Worse exception messages)")
#else
#warning CXA_DEMANGLE API not avaliable. Type demangling is not enabled. (Worse exception messages)
#endif

std::string ex::demangle(const char* name)
{
	return std::string(name);
}

#endif
