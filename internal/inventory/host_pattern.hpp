#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace fleet::inventory {

class ResolvedInventory;

/*
  Host selection patterns:

    all, *            every host
    <group>           hosts of the group and its descendants
    <host>            that host
    ~<regex>          hosts whose name matches the regex
    web*, db[12]      shell-style glob on host names
    a:b  a,b          union
    a:&b              intersection
    a:!b              exclusion

  A plain name that is neither a group nor a host, an empty component and a
  bad regex raise util::InvalidPattern. Globs and regexes may match nothing.
  The result is sorted by host name.
*/
std::vector<std::string> MatchHosts(const ResolvedInventory& inventory, std::string_view pattern);

// Converts a shell glob to an anchored ECMAScript regex.
std::string GlobToRegex(std::string_view glob);

} // namespace fleet::inventory
