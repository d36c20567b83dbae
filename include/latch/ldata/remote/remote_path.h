/**
 * @file remote_path.h
 * @brief Remote path normalization
 */

#ifndef LATCH_LDATA_REMOTE_REMOTE_PATH_H
#define LATCH_LDATA_REMOTE_REMOTE_PATH_H

#include <string>
#include <string_view>

namespace latch::ldata {

inline constexpr std::string_view remote_scheme = "latch://";

/**
 * @brief Canonical form of a user-supplied remote path
 *
 * Scheme-less paths get "latch://" prepended ("/a/b" -> "latch:///a/b",
 * "a/b" -> "latch:///a/b"). Runs of '/' after the authority collapse to
 * one. A trailing '/' is kept, since it decides whether a directory is
 * copied by name or by contents.
 */
[[nodiscard]] auto normalize_remote_path(std::string_view path) -> std::string;

/**
 * @brief Last non-empty component of a remote path
 */
[[nodiscard]] auto remote_basename(std::string_view path) -> std::string;

}  // namespace latch::ldata

#endif  // LATCH_LDATA_REMOTE_REMOTE_PATH_H
