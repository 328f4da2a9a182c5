#ifndef CHINAGTFS_TESTS_CITYFIXTURE_H_
#define CHINAGTFS_TESTS_CITYFIXTURE_H_

#include <chinagtfs/metroman/bundle.h>

#include <string>

namespace chinagtfs::tests
{
const std::string fixture_version = "20240101";

// Three stations on one line, two directions, two schedules. The table named
// by skip is left out of the archive.
inline metroman::memory_bundle make_city_archive(const std::string& skip = "")
{
    metroman::memory_bundle archive;
    auto add = [&](const std::string& table, const std::string& contents) {
        if (table != skip)
            archive.add(fixture_version + "/" + table, contents);
    };

    add("uno.csv",
        "0101<,>MS<,>Xinzhuang<,>莘庄<,>莘莊<,>シンジュアン<,>XZ<,>莘<,>31.111<,>121.385<,>10<,>20\r\n"
        "0102<,>MS<,>Waihuanlu<,>外环路<,>外環路<,><,>WHL<,>外<,>31.120<,>121.393<,>11<,>21\r\n"
        "0103<,>MS<,>Lianhua Road<,>莲花路<,>蓮花路<,><,>LHR<,>莲<,>31.131<,>121.402<,>12<,>22\r\n"
        "L1<,>ML<,>Line 1<,>1号线<,>1號線<,><,>1<,>1<,><,><,><,><,>#E4002B\r\n"
        "W1<,>WL<,>Walk<,>步行<,><,><,><,><,><,><,><,><,>#CCCCCC\r\n"
        "R1<,>MW<,>Line 1 to Lianhua Road<,>1号线 往莲花路<,><,><,><,>\r\n"
        "R2<,>MW<,>Line 1 to Xinzhuang<,>1号线 往莘庄<,><,><,><,>\r\n"
        "R3<,>WW<,>Transfer<,>换乘<,><,><,><,>\r\n"
        "X1<,>ZZ<,>Unknown\r\n");
    add("line.csv", "L1,0,1,2\r\nL9,0\r\n");
    add("way.csv", "R1,0,x,0,1,2\r\nR2,0,x,2,1,0\r\nR9,0,x,0,1\r\n");
    add("fare.csv", "F1,R1,3,,\r\nF2,R1|R2,0,fare_matrix.csv,0101|0103\r\n");
    add("fare_matrix.csv", "3,4\r\n4,3\r\n");
    add("holiday.csv", "20241001\r\n20241002\r\n");
    add("schedule.csv",
        "S1<,>1<,>1<,>1<,>1<,>1<,>0<,>0<,>x<,>0\r\n"
        "S2<,>0<,>0<,>0<,>0<,>0<,>1<,>1<,>x<,>1\r\n");
    add("wayschedule.csv", "R1,x,S1,S2\r\nR2,x,S1,S9\r\n");
    add("path_latlng.csv", "31.111,121.385\r\n31.115,121.389\r\n31.120,121.393\r\n31.131,121.402\r\n");
    add("path_rail.csv", "L1,0101,0102,0,2\r\nL1,0102,0103,2,3\r\nL1,0103,0104,3,9\r\n");

    // hops are dumped in station index order of their departure station
    add("R1.csv", "480,485\r\n485,490\r\n600,605\r\n605,610\r\n");
    add("R2.csv", "505,510\r\n500,505\r\n");

    return archive;
}

}  // namespace chinagtfs::tests

#endif  // CHINAGTFS_TESTS_CITYFIXTURE_H_
