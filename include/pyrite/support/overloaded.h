/***
 * Name: pyrite::support::overloaded
 * Purpose: Build one visitor out of several lambdas for std::visit.
 */
#pragma once

namespace pyrite {
namespace support {

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace support
}  // namespace pyrite
