#ifndef BINIO_HPP
#define BINIO_HPP

#include <algorithm>
#include <bit>
#include <istream>
#include <type_traits>

#include <cstddef>

// mixed endian systems apparently do exist, so do a static_assert to make sure we're one or the other
static_assert(std::endian::native == std::endian::big || std::endian::native == std::endian::little);

template <typename T> requires std::is_integral_v<T>
T bswap(T a)
{
    auto & buf = reinterpret_cast<std::byte(&)[sizeof(T)]>(a);
    std::reverse(std::begin(buf), std::end(buf));
    return a;
}

// read a fixed-width integer stored with the given byte order
template <typename T> requires std::is_integral_v<T>
void readb(std::istream & i, T & t, std::endian endian = std::endian::little)
{
    auto & buf = reinterpret_cast<char(&)[sizeof(T)]>(t);
    i.read(buf, sizeof(buf));
    if(std::endian::native != endian)
        t = bswap(t);
}

template <typename T> requires std::is_integral_v<T>
T readb(std::istream & i, std::endian endian = std::endian::little)
{
    T t{0};
    readb(i, t, endian);
    return t;
}

#endif // BINIO_HPP
