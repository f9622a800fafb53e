#pragma once

#include <compare>
#include <string>
#include <vector>

namespace updater
{

// Dotted numeric version ("1.10.0", "v2.3"). Any number of segments;
// missing trailing segments compare as zero, so "1.0" == "1.0.0".
class Version
{
public:
    // Construct from version string; an unparsable string gives 0
    explicit Version(const std::string& versionString);

    // Default constructor (0)
    Version();

    const std::vector<unsigned long long>& segments() const { return segments_; }

    // Convert to string (e.g., "1.10.0")
    std::string toString() const;

    std::strong_ordering operator<=>(const Version& other) const;
    bool operator==(const Version& other) const;

    // Parse version string (returns true if valid)
    static bool tryParse(const std::string& versionString, Version& outVersion);

    // True when candidate should be offered over current. Numeric comparison
    // when both parse; otherwise any difference between the strings counts as
    // newer. An empty candidate is never newer.
    static bool isNewer(const std::string& current, const std::string& candidate);

    // First dotted number in free text ("Release 1.4.2 (stable)" -> "1.4.2"),
    // empty when there is none
    static std::string extractDotted(const std::string& text);

private:
    std::vector<unsigned long long> segments_;

    bool parseString(const std::string& versionString);
};

} // namespace updater
