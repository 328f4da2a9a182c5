// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#include <chinagtfs/metroman/bundle.h>

#include <fstream>
#include <sstream>
#include <utility>

namespace chinagtfs::metroman
{
// _____________________________________________________________________________
directory_bundle::directory_bundle(std::string root) :
    root_{std::move(root)}
{
    if (!root_.empty() && root_.back() != '/')
        root_ += '/';
}

// _____________________________________________________________________________
std::optional<std::string> directory_bundle::read(const std::string& path) const
{
    std::ifstream in(root_ + path, std::ios::binary);
    if (!in.is_open())
        return std::nullopt;

    std::stringstream contents;
    contents << in.rdbuf();
    return contents.str();
}

// _____________________________________________________________________________
void memory_bundle::add(const std::string& path, std::string contents)
{
    tables_[path] = std::move(contents);
}

// _____________________________________________________________________________
std::optional<std::string> memory_bundle::read(const std::string& path) const
{
    auto it = tables_.find(path);
    if (it == tables_.end())
        return std::nullopt;
    return it->second;
}

// _____________________________________________________________________________
std::string table_path(const std::string& version, const std::string& table)
{
    return version + "/" + table + ".csv";
}

}  // namespace chinagtfs::metroman
