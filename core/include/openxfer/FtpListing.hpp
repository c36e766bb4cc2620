// Parsing of machine-readable FTP listings (RFC 3659 MLSD/MLST facts).
#pragma once
#include "XferTypes.hpp"
#include <string>
#include <vector>

namespace openxfer {

// Parses one "fact=value;fact=value; name" line. Returns false if the line
// carries no facts. The entry name is reduced to its base name.
bool parseMlsxLine(const std::string& line, FileInfo& out);

// Parses an MLSD body. "cdir"/"pdir" entries and blank lines are skipped;
// listing order is preserved.
bool parseMlsdListing(const std::string& body, std::vector<FileInfo>& out, Error& err);

// Extracts the fact line of a multi-line MLST reply ("250-...\r\n facts
// path\r\n250 End").
bool parseMlstReply(const std::string& reply, FileInfo& out, Error& err);

// Directory name from a PWD reply ("257 \"/home/u\" is current"), with
// doubled quotes undone. Returns false if no 257 line carries a name.
bool parsePwdReply(const std::string& reply, std::string& dir);

// Absolute form of a path given to a raw FTP command. Relative paths are
// taken from the login directory; an empty home leaves them unchanged.
std::string resolveFtpPath(const std::string& home, const std::string& path);

} // namespace openxfer
