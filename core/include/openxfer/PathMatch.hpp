// Shell-style pattern matching on remote paths.
//
//   *        any sequence of characters except '/'
//   ?        any single character except '/'
//   [...]    character class, ranges "a-z", negation "[^...]", non-empty
//   \c       the literal character c
#pragma once
#include "XferTypes.hpp"
#include <string>

namespace openxfer {

// True if the pattern contains any of the special characters "*?[\".
bool hasMeta(const std::string& pattern);

// Checks the whole pattern syntax. Fails with ErrorKind::BadPattern.
bool validatePattern(const std::string& pattern, Error& err);

// Matches name against pattern. Returns false only on a malformed pattern;
// the match result goes to `matched`.
bool pathMatch(const std::string& pattern,
               const std::string& name,
               bool& matched,
               Error& err);

// Splits at the last '/': "a/b/*.txt" -> ("a/b", "*.txt"), "/x" -> ("/", "x"),
// "x" -> ("", "x").
void splitRemotePath(const std::string& path, std::string& dir, std::string& base);

std::string joinRemotePath(const std::string& dir, const std::string& name);

} // namespace openxfer
