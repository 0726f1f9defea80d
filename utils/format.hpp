#ifndef UTILS_FORMAT_HPP
#define UTILS_FORMAT_HPP

#include <algorithm>
#include <array>
#include <cassert>
#include <charconv>
#include <concepts>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <tuple>

namespace fmt {
namespace internal {

template <typename T>
concept Arithmetic =
   std::is_arithmetic_v<std::decay_t<T>> && !std::is_same_v<std::decay_t<T>, bool> &&
   !std::is_same_v<std::decay_t<T>, char>;

inline std::span<char> WriteAsText(std::string_view arg, std::span<char> dest)
{
   const size_t length = std::min(arg.size(), dest.size());
   std::copy_n(arg.cbegin(), length, dest.begin());
   return dest.subspan(length);
}
// Numbers are rendered into scratch storage first, so a destination too
// short for the whole number receives its leading digits.
template <Arithmetic T>
std::span<char> WriteAsText(T arg, std::span<char> dest)
{
   constexpr size_t SCRATCH_SIZE = std::is_floating_point_v<std::decay_t<T>> ? 512 : 32;
   std::array<char, SCRATCH_SIZE> scratch;
   std::to_chars_result result;
   if constexpr (std::is_floating_point_v<std::decay_t<T>>)
      result = std::to_chars(scratch.data(), scratch.data() + scratch.size(), arg, std::chars_format::fixed);
   else
      result = std::to_chars(scratch.data(), scratch.data() + scratch.size(), arg);
   const auto [last, ec] = result;
   if (ec != std::errc())
      return dest;
   return WriteAsText(std::string_view(scratch.data(), std::distance(scratch.data(), last)), dest);
}
inline std::span<char> WriteAsText(char arg, std::span<char> dest)
{
   if (dest.empty())
      return dest;
   dest[0] = arg;
   return dest.subspan(1);
}
inline std::span<char> WriteAsText(bool arg, std::span<char> dest)
{
   static constexpr std::string_view t = "true";
   static constexpr std::string_view f = "false";
   return arg ? WriteAsText(t, dest) : WriteAsText(f, dest);
}
inline std::span<char> WriteAsText(const char * arg, std::span<char> dest)
{
   return WriteAsText(std::string_view(arg), dest);
}
inline std::span<char> WriteAsText(const std::string & arg, std::span<char> dest)
{
   return WriteAsText(std::string_view(arg), dest);
}
// clang-format off
template <typename T>
concept Writable = requires(T && arg, std::span<char> buf) {
   { WriteAsText(std::forward<T>(arg), buf) } -> std::same_as<std::span<char>>;
};
// clang-format on

inline size_t ParsePlaceholder(std::string_view from)
{
   static constexpr std::string_view placeholder = "{}";
   return from.starts_with(placeholder) ? placeholder.size() : 0;
}
inline size_t CountPlaceholders(std::string_view fmt)
{
   size_t count = 0;
   for (size_t i = 0; i < fmt.size(); ++i)
      count += ParsePlaceholder(fmt.substr(i)) ? 1 : 0;
   return count;
}
inline std::tuple<std::string_view, std::span<char>> CopyUntilPlaceholder(std::string_view src,
                                                                          std::span<char> dest)
{
   size_t srcPos = 0;
   size_t destPos = 0;
   while (srcPos < src.size() && destPos < dest.size()) {
      const size_t placeholderLength = ParsePlaceholder(src.substr(srcPos));
      if (placeholderLength > 0) {
         srcPos += placeholderLength;
         break;
      }
      dest[destPos++] = src[srcPos++];
   }
   return {src.substr(srcPos), dest.subspan(destPos)};
}

} // namespace internal

template <typename T>
concept Formattable = internal::Writable<T>;

// Substitutes each "{}" in fmt with the next argument. Output is truncated
// to the size of buffer; returns the unused tail of buffer.
template <Formattable... Ts>
std::span<char> Format(std::span<char> buffer, std::string_view fmt, Ts &&... args)
{
   using namespace internal;
   assert(CountPlaceholders(fmt) == sizeof...(Ts));
   if constexpr (sizeof...(Ts) > 0) {
      auto ProcessArg = [&](auto && arg) {
         std::tie(fmt, buffer) = CopyUntilPlaceholder(fmt, buffer);
         if (!buffer.empty())
            buffer = WriteAsText(std::forward<decltype(arg)>(arg), buffer);
         return !buffer.empty();
      };
      static_cast<void>((... && ProcessArg(std::forward<Ts>(args))));
   }
   std::tie(fmt, buffer) = CopyUntilPlaceholder(fmt, buffer);
   return buffer;
}

template <size_t Capacity = 512, Formattable... Ts>
std::string ToString(std::string_view fmt, Ts &&... args)
{
   std::array<char, Capacity> buffer;
   const auto tail = Format(buffer, fmt, std::forward<Ts>(args)...);
   return std::string(buffer.data(), buffer.size() - tail.size());
}

} // namespace fmt

#endif // UTILS_FORMAT_HPP
