#pragma once
#include <gtfs/exceptions/invalid_field_format.h>
