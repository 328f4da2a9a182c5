// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#ifndef CHINAGTFS_METROMAN_BUNDLE_H_
#define CHINAGTFS_METROMAN_BUNDLE_H_

#include <map>
#include <optional>
#include <string>

namespace chinagtfs::metroman
{
/*
 * The tables of one fetched city archive, addressed by their exact path
 * inside the archive ("{version}/{table}.csv").
 */
class bundle
{
public:
    virtual ~bundle() = default;

    // std::nullopt if the archive has no such table
    virtual std::optional<std::string> read(const std::string& path) const = 0;
};

/*
 * An archive extracted to a directory on disk.
 */
class directory_bundle : public bundle
{
public:
    explicit directory_bundle(std::string root);

    std::optional<std::string> read(const std::string& path) const override;

    const std::string& root() const
    {
        return root_;
    }

private:
    std::string root_;
};

/*
 * An archive held in memory, path -> contents.
 */
class memory_bundle : public bundle
{
public:
    memory_bundle() = default;

    void add(const std::string& path, std::string contents);
    std::optional<std::string> read(const std::string& path) const override;

private:
    std::map<std::string, std::string> tables_;
};

std::string table_path(const std::string& version, const std::string& table);

}  // namespace chinagtfs::metroman

#endif  // CHINAGTFS_METROMAN_BUNDLE_H_
