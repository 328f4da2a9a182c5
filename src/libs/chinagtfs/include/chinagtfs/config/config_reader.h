// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#ifndef CHINAGTFS_CONFIG_CONFIGREADER_H_
#define CHINAGTFS_CONFIG_CONFIGREADER_H_

#include <chinagtfs/config/config.h>

namespace chinagtfs::config
{

class config_reader
{
public:
    explicit config_reader(config& cfg);

    // Exits the process on -h, -v and malformed arguments.
    void read(int argc, char** argv);
    void help(const char* bin) const;

private:
    config& config_;
};

}  // namespace chinagtfs::config

#endif  // CHINAGTFS_CONFIG_CONFIGREADER_H_
