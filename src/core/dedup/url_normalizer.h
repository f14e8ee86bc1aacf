#pragma once

#include <QString>

namespace nr {

class UrlNormalizer {
public:
    // Canonical form used for Stage A identity:
    //   - fragment and query string removed (tracking parameters live there)
    //   - scheme and host lower-cased
    //   - trailing slashes removed from the path
    // Returns an empty string for empty or unparseable input.
    static QString normalize(const QString& rawUrl);
};

} // namespace nr
