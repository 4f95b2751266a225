#include "EntityTypes.hpp"

#include <algorithm>
#include <cctype>

namespace lexanon
{

namespace
{

std::string lowerAscii(const std::string& s)
{
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(out.begin(), out.end(), '_', '-');
    return out;
}

} // namespace

const char* toString(EntityType type)
{
    switch (type)
    {
    case EntityType::Person:
        return "person";
    case EntityType::Organization:
        return "organization";
    case EntityType::Phone:
        return "phone";
    case EntityType::Email:
        return "email";
    case EntityType::NationalId:
        return "national-id";
    case EntityType::RegistryNumber:
        return "registry-number";
    case EntityType::Address:
        return "address";
    case EntityType::LegalReference:
        return "legal-reference";
    case EntityType::Other:
        return "other";
    }
    return "other";
}

const char* toString(EntitySource source)
{
    switch (source)
    {
    case EntitySource::Pattern:
        return "pattern";
    case EntitySource::Model:
        return "model";
    case EntitySource::Manual:
        return "manual";
    }
    return "manual";
}

std::optional<EntityType> parseEntityType(const std::string& name)
{
    const std::string key = lowerAscii(name);

    for (EntityType type : kAllEntityTypes)
    {
        if (key == toString(type))
            return type;
    }

    // Legacy French detector labels
    if (key == "personne" || key == "per")
        return EntityType::Person;
    if (key == "organisation" || key == "org")
        return EntityType::Organization;
    if (key == "telephone")
        return EntityType::Phone;
    if (key == "secu-sociale")
        return EntityType::NationalId;
    if (key == "siret" || key == "siren")
        return EntityType::RegistryNumber;
    if (key == "adresse")
        return EntityType::Address;
    if (key == "reference-juridique")
        return EntityType::LegalReference;

    return std::nullopt;
}

std::optional<EntitySource> parseEntitySource(const std::string& name)
{
    const std::string key = lowerAscii(name);
    if (key == "pattern" || key == "regex")
        return EntitySource::Pattern;
    if (key == "model" || key == "ner")
        return EntitySource::Model;
    if (key == "manual" || key == "custom")
        return EntitySource::Manual;
    return std::nullopt;
}

int sourcePriority(EntitySource source)
{
    switch (source)
    {
    case EntitySource::Pattern:
        return 2;
    case EntitySource::Manual:
        return 1;
    case EntitySource::Model:
        return 0;
    }
    return 0;
}

double BoundingBox::area() const
{
    if (!isValid())
        return 0.0;
    return (x1 - x0) * (y1 - y0);
}

bool BoundingBox::isValid() const { return x1 > x0 && y1 > y0; }

bool BoundingBox::overlaps(const BoundingBox& other) const
{
    if (page != other.page)
        return false;
    const double w = std::min(x1, other.x1) - std::max(x0, other.x0);
    const double h = std::min(y1, other.y1) - std::max(y0, other.y0);
    return w > 0.0 && h > 0.0;
}

bool EntityGroup::hasMember(const EntityId& entity_id) const
{
    return std::find(member_ids.begin(), member_ids.end(), entity_id) != member_ids.end();
}

bool EntityFilter::matches(const Entity& entity) const
{
    if (type && entity.type != *type)
        return false;
    if (source && entity.source != *source)
        return false;
    if (min_confidence && entity.confidence < *min_confidence)
        return false;
    return true;
}

} // namespace lexanon
