#ifndef BINARYCODEC_H
#define BINARYCODEC_H

#include "../../include/crm_types.hpp"
#include "../../include/crm_errors.hpp"
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <cmath>
#include <string>
#include <vector>
using namespace std;

// ============================================================================
// FIELD PRIMITIVES
// ============================================================================

namespace wire
{
    inline void put_flag(uint8_t *dst, bool value)
    {
        dst[0] = value ? 1 : 0;
    }

    inline bool get_flag(const uint8_t *src)
    {
        if (src[0] > 1)
        {
            throw FormatError("Flag byte out of range: " + to_string(src[0]));
        }
        return src[0] == 1;
    }

    inline void put_i32(uint8_t *dst, int32_t value)
    {
        uint32_t bits = static_cast<uint32_t>(value);
        for (int i = 0; i < 4; i++)
        {
            dst[i] = static_cast<uint8_t>(bits >> (8 * i));
        }
    }

    inline int32_t get_i32(const uint8_t *src)
    {
        uint32_t bits = 0;
        for (int i = 0; i < 4; i++)
        {
            bits |= static_cast<uint32_t>(src[i]) << (8 * i);
        }
        return static_cast<int32_t>(bits);
    }

    inline void put_f64(uint8_t *dst, double value)
    {
        uint64_t bits;
        memcpy(&bits, &value, sizeof(bits));
        for (int i = 0; i < 8; i++)
        {
            dst[i] = static_cast<uint8_t>(bits >> (8 * i));
        }
    }

    inline double get_f64(const uint8_t *src)
    {
        uint64_t bits = 0;
        for (int i = 0; i < 8; i++)
        {
            bits |= static_cast<uint64_t>(src[i]) << (8 * i);
        }
        double value;
        memcpy(&value, &bits, sizeof(value));
        return value;
    }

    // Callers truncate before encoding; an oversized value here is a bug
    // upstream and nothing is written.
    inline void put_text(uint8_t *dst, size_t width, const string &text, const char *field)
    {
        if (text.size() > width)
        {
            throw ValidationError(string(field) + " exceeds " + to_string(width) + " bytes");
        }
        memset(dst, 0, width);
        memcpy(dst, text.data(), text.size());
    }

    inline bool is_valid_utf8(const string &text)
    {
        size_t i = 0;
        while (i < text.size())
        {
            unsigned char c = static_cast<unsigned char>(text[i]);
            size_t extra;
            uint32_t code_point;
            if (c < 0x80)
            {
                i++;
                continue;
            }
            else if ((c & 0xE0) == 0xC0)
            {
                extra = 1;
                code_point = c & 0x1F;
            }
            else if ((c & 0xF0) == 0xE0)
            {
                extra = 2;
                code_point = c & 0x0F;
            }
            else if ((c & 0xF8) == 0xF0)
            {
                extra = 3;
                code_point = c & 0x07;
            }
            else
            {
                return false;
            }

            if (i + extra >= text.size())
            {
                return false;
            }
            for (size_t k = 1; k <= extra; k++)
            {
                unsigned char cc = static_cast<unsigned char>(text[i + k]);
                if ((cc & 0xC0) != 0x80)
                    return false;
                code_point = (code_point << 6) | (cc & 0x3F);
            }

            // overlong forms, surrogates, beyond U+10FFFF
            if ((extra == 1 && code_point < 0x80) ||
                (extra == 2 && code_point < 0x800) ||
                (extra == 3 && code_point < 0x10000) ||
                (code_point >= 0xD800 && code_point <= 0xDFFF) ||
                code_point > 0x10FFFF)
            {
                return false;
            }
            i += extra + 1;
        }
        return true;
    }

    inline string trim(const string &text)
    {
        size_t first = text.find_first_not_of(" \t\r\n\v\f");
        if (first == string::npos)
            return "";
        size_t last = text.find_last_not_of(" \t\r\n\v\f");
        return text.substr(first, last - first + 1);
    }

    // Bytes up to the first zero, trimmed. Undecodable text reads as "".
    inline string get_text(const uint8_t *src, size_t width)
    {
        const void *zero = memchr(src, 0, width);
        size_t length = zero ? static_cast<size_t>(static_cast<const uint8_t *>(zero) - src) : width;
        string text(reinterpret_cast<const char *>(src), length);
        if (!is_valid_utf8(text))
        {
            return "";
        }
        return trim(text);
    }

    // Cuts at a character boundary so a multi-byte sequence is never split.
    inline string truncate_utf8(const string &text, size_t width)
    {
        if (text.size() <= width)
            return text;
        size_t cut = width;
        while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
        {
            cut--;
        }
        return text.substr(0, cut);
    }

    inline void check_block(size_t actual, size_t expected, const char *entity)
    {
        if (actual != expected)
        {
            throw FormatError(string(entity) + " block must be " + to_string(expected) +
                              " bytes, got " + to_string(actual));
        }
    }
}

// ============================================================================
// ENTITY CODECS
// ============================================================================
// Each codec is the binding a RecordStore needs: the record and patch
// types, the slot size, identity accessors, encode/decode, patch merge and
// field validation.

struct CarCodec
{
    typedef Car record_type;
    typedef CarPatch patch_type;
    static constexpr size_t RECORD_SIZE = sizeof(CarSlot);
    static constexpr const char *ENTITY_NAME = "Car";

    static int32_t id_of(const Car &car) { return car.car_id; }

    static void set_identity(Car &car, int32_t id, bool active)
    {
        car.car_id = id;
        car.is_active = active;
    }

    static vector<uint8_t> encode(const Car &car)
    {
        vector<uint8_t> block(RECORD_SIZE, 0);
        uint8_t *p = block.data();
        wire::put_flag(p + offsetof(CarSlot, is_active), car.is_active);
        wire::put_i32(p + offsetof(CarSlot, car_id), car.car_id);
        wire::put_text(p + offsetof(CarSlot, model), CAR_MODEL_LEN, car.model, "Model");
        wire::put_text(p + offsetof(CarSlot, license_plate), CAR_PLATE_LEN, car.license_plate, "LicensePlate");
        wire::put_f64(p + offsetof(CarSlot, daily_rate), car.daily_rate);
        wire::put_flag(p + offsetof(CarSlot, is_rented), car.is_rented);
        return block;
    }

    static Car decode(const uint8_t *data, size_t size)
    {
        wire::check_block(size, RECORD_SIZE, ENTITY_NAME);
        Car car;
        car.is_active = wire::get_flag(data + offsetof(CarSlot, is_active));
        car.car_id = wire::get_i32(data + offsetof(CarSlot, car_id));
        car.model = wire::get_text(data + offsetof(CarSlot, model), CAR_MODEL_LEN);
        car.license_plate = wire::get_text(data + offsetof(CarSlot, license_plate), CAR_PLATE_LEN);
        car.daily_rate = wire::get_f64(data + offsetof(CarSlot, daily_rate));
        car.is_rented = wire::get_flag(data + offsetof(CarSlot, is_rented));
        return car;
    }

    static Car decode(const vector<uint8_t> &block)
    {
        return decode(block.data(), block.size());
    }

    static void apply(Car &car, const CarPatch &patch)
    {
        if (patch.model)
            car.model = *patch.model;
        if (patch.license_plate)
            car.license_plate = *patch.license_plate;
        if (patch.daily_rate)
            car.daily_rate = *patch.daily_rate;
        if (patch.is_rented)
            car.is_rented = *patch.is_rented;
    }

    static void validate(const Car &car)
    {
        if (car.car_id <= 0)
            throw ValidationError("Car ID must be positive");
        if (wire::trim(car.model).empty())
            throw ValidationError("Car model is required");
        if (wire::trim(car.license_plate).empty())
            throw ValidationError("Car license plate is required");
        if (car.model.size() > CAR_MODEL_LEN)
            throw ValidationError("Car model exceeds " + to_string(CAR_MODEL_LEN) + " bytes");
        if (car.license_plate.size() > CAR_PLATE_LEN)
            throw ValidationError("License plate exceeds " + to_string(CAR_PLATE_LEN) + " bytes");
        if (!isfinite(car.daily_rate) || car.daily_rate < 0)
            throw ValidationError("Daily rate must be a non-negative number");
    }
};

struct CustomerCodec
{
    typedef Customer record_type;
    typedef CustomerPatch patch_type;
    static constexpr size_t RECORD_SIZE = sizeof(CustomerSlot);
    static constexpr const char *ENTITY_NAME = "Customer";

    static int32_t id_of(const Customer &customer) { return customer.customer_id; }

    static void set_identity(Customer &customer, int32_t id, bool active)
    {
        customer.customer_id = id;
        customer.is_active = active;
    }

    static vector<uint8_t> encode(const Customer &customer)
    {
        vector<uint8_t> block(RECORD_SIZE, 0);
        uint8_t *p = block.data();
        wire::put_flag(p + offsetof(CustomerSlot, is_active), customer.is_active);
        wire::put_i32(p + offsetof(CustomerSlot, customer_id), customer.customer_id);
        wire::put_text(p + offsetof(CustomerSlot, name), CUSTOMER_NAME_LEN, customer.name, "Name");
        wire::put_text(p + offsetof(CustomerSlot, phone), CUSTOMER_PHONE_LEN, customer.phone, "Phone");
        return block;
    }

    static Customer decode(const uint8_t *data, size_t size)
    {
        wire::check_block(size, RECORD_SIZE, ENTITY_NAME);
        Customer customer;
        customer.is_active = wire::get_flag(data + offsetof(CustomerSlot, is_active));
        customer.customer_id = wire::get_i32(data + offsetof(CustomerSlot, customer_id));
        customer.name = wire::get_text(data + offsetof(CustomerSlot, name), CUSTOMER_NAME_LEN);
        customer.phone = wire::get_text(data + offsetof(CustomerSlot, phone), CUSTOMER_PHONE_LEN);
        return customer;
    }

    static Customer decode(const vector<uint8_t> &block)
    {
        return decode(block.data(), block.size());
    }

    static void apply(Customer &customer, const CustomerPatch &patch)
    {
        if (patch.name)
            customer.name = *patch.name;
        if (patch.phone)
            customer.phone = *patch.phone;
    }

    static void validate(const Customer &customer)
    {
        if (customer.customer_id <= 0)
            throw ValidationError("Customer ID must be positive");
        if (wire::trim(customer.name).empty())
            throw ValidationError("Customer name is required");
        if (wire::trim(customer.phone).empty())
            throw ValidationError("Customer phone is required");
        if (customer.name.size() > CUSTOMER_NAME_LEN)
            throw ValidationError("Customer name exceeds " + to_string(CUSTOMER_NAME_LEN) + " bytes");
        if (customer.phone.size() > CUSTOMER_PHONE_LEN)
            throw ValidationError("Phone exceeds " + to_string(CUSTOMER_PHONE_LEN) + " bytes");
    }
};

struct RentalCodec
{
    typedef Rental record_type;
    typedef RentalPatch patch_type;
    static constexpr size_t RECORD_SIZE = sizeof(RentalSlot);
    static constexpr const char *ENTITY_NAME = "Rental";

    static int32_t id_of(const Rental &rental) { return rental.rental_id; }

    static void set_identity(Rental &rental, int32_t id, bool active)
    {
        rental.rental_id = id;
        rental.is_active = active;
    }

    static vector<uint8_t> encode(const Rental &rental)
    {
        vector<uint8_t> block(RECORD_SIZE, 0);
        uint8_t *p = block.data();
        wire::put_flag(p + offsetof(RentalSlot, is_active), rental.is_active);
        wire::put_i32(p + offsetof(RentalSlot, rental_id), rental.rental_id);
        wire::put_i32(p + offsetof(RentalSlot, customer_id), rental.customer_id);
        wire::put_i32(p + offsetof(RentalSlot, car_id), rental.car_id);
        wire::put_i32(p + offsetof(RentalSlot, start_date), rental.start_date);
        wire::put_i32(p + offsetof(RentalSlot, end_date), rental.end_date);
        wire::put_f64(p + offsetof(RentalSlot, total_price), rental.total_price);
        return block;
    }

    static Rental decode(const uint8_t *data, size_t size)
    {
        wire::check_block(size, RECORD_SIZE, ENTITY_NAME);
        Rental rental;
        rental.is_active = wire::get_flag(data + offsetof(RentalSlot, is_active));
        rental.rental_id = wire::get_i32(data + offsetof(RentalSlot, rental_id));
        rental.customer_id = wire::get_i32(data + offsetof(RentalSlot, customer_id));
        rental.car_id = wire::get_i32(data + offsetof(RentalSlot, car_id));
        rental.start_date = wire::get_i32(data + offsetof(RentalSlot, start_date));
        rental.end_date = wire::get_i32(data + offsetof(RentalSlot, end_date));
        rental.total_price = wire::get_f64(data + offsetof(RentalSlot, total_price));
        return rental;
    }

    static Rental decode(const vector<uint8_t> &block)
    {
        return decode(block.data(), block.size());
    }

    static void apply(Rental &rental, const RentalPatch &patch)
    {
        if (patch.customer_id)
            rental.customer_id = *patch.customer_id;
        if (patch.car_id)
            rental.car_id = *patch.car_id;
        if (patch.start_date)
            rental.start_date = *patch.start_date;
        if (patch.end_date)
            rental.end_date = *patch.end_date;
        if (patch.total_price)
            rental.total_price = *patch.total_price;
    }

    static void validate(const Rental &rental)
    {
        if (rental.rental_id <= 0)
            throw ValidationError("Rental ID must be positive");
        if (rental.customer_id <= 0)
            throw ValidationError("Rental customer ID must be positive");
        if (rental.car_id <= 0)
            throw ValidationError("Rental car ID must be positive");
        if (!isfinite(rental.total_price) || rental.total_price < 0)
            throw ValidationError("Total price must be a non-negative number");
    }
};

#endif
