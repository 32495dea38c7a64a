#pragma once

#include <type_traits>
#include <functional>
#include <string>
#include <typeinfo>

#include "Exrange_export.h"

namespace ex
{

std::string EXRANGE_EXPORT demangle(const char* name);

template <typename T>
inline std::string typeName() { return demangle(typeid(T).name()); }

template<typename Test, template<typename...> class Ref>
struct is_specialization : std::false_type {};

template<template<typename...> class Ref, typename... Args>
struct is_specialization<Ref<Args...>, Ref>: std::true_type {};

template<typename Test, template<typename...> class Ref>
constexpr bool is_specialization_v = is_specialization<Test, Ref>::value;

template <typename T, typename = void>
struct is_container : std::false_type {};

template <typename T>
struct is_container<T
	, std::void_t<decltype(std::declval<T>().data())
		, decltype(std::declval<T>().size())>> : std::true_type {};

template <typename T>
constexpr bool is_container_v = is_container<T>::value;

//std::reference_wrapper<T> stands for a borrowed T. Unwrapping gives the referent
template <typename T>
struct unwrap_reference { using type = T; };

template <typename T>
struct unwrap_reference<std::reference_wrapper<T>> { using type = T; };

template <typename T>
using unwrap_reference_t = typename unwrap_reference<T>::type;

template <typename T>
inline const T& unwrapRef(const T& v) { return v; }

template <typename T>
inline T& unwrapRef(const std::reference_wrapper<T>& v) { return v.get(); }

}
