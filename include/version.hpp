#ifndef GHVAULT_VERSION_HPP
#define GHVAULT_VERSION_HPP

namespace ghv {

#ifdef GHVAULT_VERSION
inline constexpr const char *kVersionString = GHVAULT_VERSION;
#else
inline constexpr const char *kVersionString = "0.1.0";
#endif

} // namespace ghv

#endif // GHVAULT_VERSION_HPP
