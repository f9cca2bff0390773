#ifndef CRM_TYPES_HPP
#define CRM_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <string>
#include <optional>
using namespace std;

// Text field widths (bytes on disk, zero padded)
constexpr size_t CAR_MODEL_LEN = 30;
constexpr size_t CAR_PLATE_LEN = 10;
constexpr size_t CUSTOMER_NAME_LEN = 30;
constexpr size_t CUSTOMER_PHONE_LEN = 15;

// Default file names, one binary file per entity type
constexpr const char *CAR_FILE_NAME = "cars.bin";
constexpr const char *CUSTOMER_FILE_NAME = "customers.bin";
constexpr const char *RENTAL_FILE_NAME = "rentals.bin";

// ============================================================================
// ON-DISK SLOT LAYOUTS
// ============================================================================
// These describe the wire layout only. The codec writes every field
// little-endian at offsetof(slot, field); slots are never memcpy'd whole.

#pragma pack(push, 1)

struct CarSlot
{
    uint8_t is_active;
    int32_t car_id;
    char model[CAR_MODEL_LEN];
    char license_plate[CAR_PLATE_LEN];
    double daily_rate;
    uint8_t is_rented;
};

static_assert(sizeof(CarSlot) == 54, "CarSlot must be 54 bytes");

struct CustomerSlot
{
    uint8_t is_active;
    int32_t customer_id;
    char name[CUSTOMER_NAME_LEN];
    char phone[CUSTOMER_PHONE_LEN];
};

static_assert(sizeof(CustomerSlot) == 50, "CustomerSlot must be 50 bytes");

struct RentalSlot
{
    uint8_t is_active;
    int32_t rental_id;
    int32_t customer_id;
    int32_t car_id;
    int32_t start_date;
    int32_t end_date;
    double total_price;
};

static_assert(sizeof(RentalSlot) == 29, "RentalSlot must be 29 bytes");

#pragma pack(pop)

// ============================================================================
// DECODED RECORDS
// ============================================================================

struct Car
{
    bool is_active;
    int32_t car_id;
    string model;
    string license_plate;
    double daily_rate;
    bool is_rented;

    Car() : is_active(true), car_id(0), daily_rate(0), is_rented(false) {}

    Car(int32_t id, const string &model_name, const string &plate, double rate)
        : is_active(true), car_id(id), model(model_name), license_plate(plate),
          daily_rate(rate), is_rented(false) {}
};

struct Customer
{
    bool is_active;
    int32_t customer_id;
    string name;
    string phone;

    Customer() : is_active(true), customer_id(0) {}

    Customer(int32_t id, const string &full_name, const string &phone_number)
        : is_active(true), customer_id(id), name(full_name), phone(phone_number) {}
};

// Dates are DDMMYYYY integers, e.g. 25102025 for 25 Oct 2025.
struct Rental
{
    bool is_active;
    int32_t rental_id;
    int32_t customer_id;
    int32_t car_id;
    int32_t start_date;
    int32_t end_date;
    double total_price;

    Rental() : is_active(true), rental_id(0), customer_id(0), car_id(0),
               start_date(0), end_date(0), total_price(0) {}
};

// ============================================================================
// PARTIAL UPDATES
// ============================================================================
// Absent fields keep their stored value. Identity (id, active flag) is
// not part of any patch.

struct CarPatch
{
    optional<string> model;
    optional<string> license_plate;
    optional<double> daily_rate;
    optional<bool> is_rented;
};

struct CustomerPatch
{
    optional<string> name;
    optional<string> phone;
};

struct RentalPatch
{
    optional<int32_t> customer_id;
    optional<int32_t> car_id;
    optional<int32_t> start_date;
    optional<int32_t> end_date;
    optional<double> total_price;
};

struct RentalRequest
{
    int32_t rental_id;
    int32_t customer_id;
    int32_t car_id;
    int32_t start_date;
    int32_t end_date;

    RentalRequest() : rental_id(0), customer_id(0), car_id(0),
                      start_date(0), end_date(0) {}
};

struct FleetSummary
{
    uint64_t total_car_slots;
    uint64_t active_cars;
    uint64_t deleted_cars;
    uint64_t currently_rented;
    uint64_t available_now;
    double min_rate;
    double max_rate;
    double avg_rate;

    FleetSummary() : total_car_slots(0), active_cars(0), deleted_cars(0),
                     currently_rented(0), available_now(0), min_rate(0),
                     max_rate(0), avg_rate(0) {}
};

#endif
