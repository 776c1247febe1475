#include "CategoryRegistry.hpp"
#include "utils/PathUtils.hpp"
#include "PathLocator.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace backup
{

CategoryNotFound::CategoryNotFound(const std::string& name)
    : std::runtime_error("Unknown backup category: " + name)
    , name_(name)
{
}

const std::vector<CategoryDefinition>& CategoryRegistry::BuiltinDefinitions()
{
    static const std::vector<CategoryDefinition> kDefinitions = {
        { "Journal",  "journal"  },
        { "Bindings", "bindings" },
        { "Graphics", "graphics" },
    };
    return kDefinitions;
}

CategoryRegistry::CategoryRegistry(const IPathLocator& locator)
{
    for (const auto& def : BuiltinDefinitions())
    {
        Category category{ def.name, locator.locate(def.name), def.archive_basename };
        PLOG_INFO << "Category " << category.name << " -> '" << utils::PathToUtf8(category.source_path) << "'";
        categories_.push_back(std::move(category));
    }
}

CategoryRegistry::CategoryRegistry(std::vector<Category> categories)
    : categories_(std::move(categories))
{
}

const Category* CategoryRegistry::find(const std::string& name) const noexcept
{
    auto it = std::find_if(categories_.begin(), categories_.end(),
                           [&](const Category& c) { return c.name == name; });
    return it == categories_.end() ? nullptr : &*it;
}

const Category& CategoryRegistry::get(const std::string& name) const
{
    if (const Category* category = find(name))
        return *category;

    PLOG_ERROR << "Category lookup failed: " << name;
    throw CategoryNotFound(name);
}

std::filesystem::path CategoryRegistry::resolve(const std::string& name) const { return get(name).source_path; }

std::vector<Category> CategoryRegistry::select(const std::vector<std::string>& names,
                                               const std::map<std::string, std::filesystem::path>& sourceOverrides) const
{
    std::vector<Category> selected;
    selected.reserve(names.size());
    for (const auto& name : names)
    {
        Category category = get(name);
        auto it = sourceOverrides.find(name);
        if (it != sourceOverrides.end() && !it->second.empty())
            category.source_path = it->second;
        selected.push_back(std::move(category));
    }
    return selected;
}

} // namespace backup
