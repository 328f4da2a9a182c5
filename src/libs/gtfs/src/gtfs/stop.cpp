#include <gtfs/stop.h>
#include <gtfs/feed.h>
namespace chinagtfs::gtfs
{

stop::stop(chinagtfs::gtfs::feed& feed) :
    record(feed)
{
}
}
