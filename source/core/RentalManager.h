#ifndef RENTALMANAGER_H
#define RENTALMANAGER_H

#include "../../include/crm_types.hpp"
#include "BinaryCodec.h"
#include "EntityStore.h"
#include <string>
#include <vector>
using namespace std;

class RentalManager : public EntityStore<RentalCodec>
{
public:
    explicit RentalManager(const string &filename = RENTAL_FILE_NAME, bool verbose = true)
        : EntityStore<RentalCodec>(filename, verbose) {}

    vector<Rental> get_rentals_by_car(int32_t car_id)
    {
        vector<Rental> rentals;
        for (const auto &rental : list_active())
        {
            if (rental.car_id == car_id)
                rentals.push_back(rental);
        }
        return rentals;
    }

    vector<Rental> get_rentals_by_customer(int32_t customer_id)
    {
        vector<Rental> rentals;
        for (const auto &rental : list_active())
        {
            if (rental.customer_id == customer_id)
                rentals.push_back(rental);
        }
        return rentals;
    }
};

#endif
