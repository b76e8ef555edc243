/**
 * @file concept.hpp
 * @author Ruan Formigoni
 * @brief Custom C++ concepts for type constraints and compile-time validation
 *
 * Concepts used by the string, logging, json and configuration layers to select
 * conversions at compile time.
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace ns_concept
{

// ============================================================================
// Template Metaprogramming Utilities
// ============================================================================

/**
 * @brief Type trait to check if a type is an instance of a template
 * @tparam T The type to check
 * @tparam U The template to match against
 */
template<typename T, template<typename...> typename U>
inline constexpr bool is_instance_of_v = std::false_type {};

/**
 * @brief Specialization for matching template instances
 * @tparam U The template type
 * @tparam Args Template arguments
 */
template<template<typename...> typename U, typename... Args>
inline constexpr bool is_instance_of_v<U<Args...>,U> = std::true_type {};

/**
 * @brief Concept to check if a type is an instance of a specific template
 * @tparam T The type to check
 * @tparam U The template to match against
 */
template<typename T, template<typename...> typename U>
concept IsInstanceOf = is_instance_of_v<std::remove_cvref_t<T>, U>;

static_assert( IsInstanceOf<std::vector<int>&, std::vector>);
static_assert( IsInstanceOf<std::optional<int>, std::optional>);
static_assert(!IsInstanceOf<std::string, std::vector>);

// ============================================================================
// Type Equality Concepts
// ============================================================================

/**
 * @brief Concept to check if all types are the same
 *
 * Automatically removes cv-qualifiers and references before comparison.
 */
template<typename T, typename... U>
concept Uniform = ( std::same_as<std::remove_cvref_t<T>, std::remove_cvref_t<U>> and ... );

static_assert( Uniform<const int&, int>);
static_assert(!Uniform<int, std::string>);

// ============================================================================
// Container Concepts
// ============================================================================

template<typename T>
concept Iterable = std::ranges::range<T>;

static_assert( Iterable<std::vector<int>>);
static_assert(!Iterable<int>);

template <typename T>
concept IsVector = IsInstanceOf<T, std::vector>;

static_assert( IsVector<std::vector<std::string>>);
static_assert(!IsVector<std::string>);

/**
 * @brief Concept for string keyed maps with string values
 *
 * Matches the shape used for http headers, labels and request parameters.
 */
template <typename T>
concept IsStringMap = IsInstanceOf<T, std::map>
  and std::same_as<typename std::remove_cvref_t<T>::key_type, std::string>
  and std::same_as<typename std::remove_cvref_t<T>::mapped_type, std::string>;

static_assert( IsStringMap<std::map<std::string,std::string>>);
static_assert(!IsStringMap<std::map<std::string,int>>);

// ============================================================================
// String Concepts
// ============================================================================

template<typename T>
concept StringConvertible = std::is_convertible_v<std::remove_cvref_t<T>, std::string>;

static_assert( StringConvertible<const char*>);
static_assert(!StringConvertible<int>);

template<typename T>
concept StringConstructible = std::constructible_from<std::string, std::remove_cvref_t<T>>;

static_assert( StringConstructible<std::string_view>);
static_assert(!StringConstructible<void*>);

// ============================================================================
// Numeric Concepts
// ============================================================================

/**
 * @brief Integral or floating-point types, bool excluded
 */
template<typename T>
concept Numeric = ( std::integral<std::remove_cvref_t<T>> or std::floating_point<std::remove_cvref_t<T>> )
  and (not std::same_as<std::remove_cvref_t<T>, bool>);

static_assert( Numeric<uint8_t>);
static_assert( Numeric<double>);
static_assert(!Numeric<bool>);
static_assert(!Numeric<std::string>);

// ============================================================================
// Stream and Formatting Concepts
// ============================================================================

template<typename T>
concept StreamInsertable = requires(T t, std::ostream& os)
{
  { os << t } -> std::same_as<std::ostream&>;
};

static_assert( StreamInsertable<int>);
static_assert(!StreamInsertable<std::vector<int>>);

/**
 * @brief Concept for types that can be represented as a string
 */
template<typename T>
concept StringRepresentable = StringConvertible<T>
  or StringConstructible<T>
  or Numeric<T>
  or std::same_as<std::remove_cvref_t<T>, bool>
  or StreamInsertable<T>;

static_assert( StringRepresentable<int>);
static_assert( StringRepresentable<bool>);
static_assert( StringRepresentable<const char*>);
static_assert(!StringRepresentable<std::vector<int>>);

} // namespace ns_concept

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
