#pragma once

#include <string>

namespace magpie::mq {

namespace exchange_type {
constexpr char direct[]  = "direct";
constexpr char topic[]   = "topic";
constexpr char fanout[]  = "fanout";
constexpr char headers[] = "headers";
} // namespace exchange_type

namespace argument {
constexpr char alternate_exchange[] = "alternate-exchange";
} // namespace argument

inline bool valid_exchange_type( const std::string& type )
{
  return type == exchange_type::direct || type == exchange_type::topic || type == exchange_type::fanout
         || type == exchange_type::headers;
}

} // namespace magpie::mq
