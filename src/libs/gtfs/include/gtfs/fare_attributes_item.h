#pragma once
#include <gtfs/enums/fare_payment.h>
#include <gtfs/enums/fare_transfers.h>
#include <gtfs/types.h>

namespace chinagtfs::gtfs
{
// Optional dataset file
struct fare_attributes_item
{
    // Required:
    Id fare_id;
    double price = 0.0;
    CurrencyCode currency_type;
    fare_payment payment_method = fare_payment::BeforeBoarding;
    // a metro fare covers one ride between two gates
    fare_transfers transfers = fare_transfers::No;

    // Conditionally required, empty for single agency feeds:
    Id agency_id;

    // Optional, 0 is written as an empty field:
    size_t transfer_duration = 0;
};
}
