#pragma once

#include "Category.hpp"

#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace backup
{

class IPathLocator;

class CategoryNotFound : public std::runtime_error
{
public:
    explicit CategoryNotFound(const std::string& name);

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

struct CategoryDefinition
{
    const char* name;
    const char* archive_basename;
};

// Immutable category table. Built once at startup and handed by reference to
// whoever needs it; nothing mutates it afterwards.
class CategoryRegistry
{
public:
    // Journal, Bindings, Graphics in display order
    static const std::vector<CategoryDefinition>& BuiltinDefinitions();

    explicit CategoryRegistry(const IPathLocator& locator);
    explicit CategoryRegistry(std::vector<Category> categories);

    CategoryRegistry(const CategoryRegistry&) = delete;
    CategoryRegistry& operator=(const CategoryRegistry&) = delete;

    // Throws CategoryNotFound
    const Category& get(const std::string& name) const;
    std::filesystem::path resolve(const std::string& name) const;

    const Category* find(const std::string& name) const noexcept;
    bool contains(const std::string& name) const noexcept { return find(name) != nullptr; }

    const std::vector<Category>& categories() const { return categories_; }

    // Copies of the named categories in request order, with per-name source
    // overrides applied. Empty overrides are ignored. Throws CategoryNotFound.
    std::vector<Category> select(const std::vector<std::string>& names,
                                 const std::map<std::string, std::filesystem::path>& sourceOverrides = {}) const;

private:
    std::vector<Category> categories_;
};

} // namespace backup
