#include "ModTypes.hpp"

namespace config
{

const char* contentTypeToString(ContentType type)
{
    switch (type)
    {
    case ContentType::Mod:
        return "mod";
    case ContentType::Tileset:
        return "tileset";
    case ContentType::Soundpack:
        return "soundpack";
    }
    return "mod";
}

ContentType contentTypeFromString(const std::string& value)
{
    if (value == "tileset")
        return ContentType::Tileset;
    if (value == "soundpack")
        return ContentType::Soundpack;
    return ContentType::Mod;
}

} // namespace config
