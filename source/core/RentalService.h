#ifndef RENTALSERVICE_H
#define RENTALSERVICE_H

#include "../../include/crm_types.hpp"
#include "../../include/crm_errors.hpp"
#include "CarManager.h"
#include "CustomerManager.h"
#include "RentalManager.h"
#include "DateUtils.h"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>
using namespace std;

// Keeps rentals and car availability in step. The stores themselves know
// nothing about each other.
class RentalService
{
private:
    CarManager &cars_;
    CustomerManager &customers_;
    RentalManager &rentals_;
    bool verbose_;

    // The rental is already committed at this point, so a failure here is
    // reported and left for the operator.
    void mark_car_rented(int32_t car_id, bool rented)
    {
        try
        {
            if (!cars_.set_rented(car_id, rented))
            {
                cerr << "Warning: car ID " << car_id << " not found while updating rented status." << endl;
                return;
            }
            if (verbose_)
            {
                cout << "Car ID " << car_id << " marked as "
                     << (rented ? "rented" : "available") << "." << endl;
            }
        }
        catch (const runtime_error &e)
        {
            cerr << "Warning: could not update car ID " << car_id << ": " << e.what() << endl;
        }
    }

public:
    RentalService(CarManager &cars, CustomerManager &customers, RentalManager &rentals,
                  bool verbose = true)
        : cars_(cars), customers_(customers), rentals_(rentals), verbose_(verbose) {}

    // Days charged for a period. Malformed dates charge a single day.
    static int64_t billable_days(int32_t start_date, int32_t end_date)
    {
        auto days = elapsed_days_inclusive(start_date, end_date);
        if (!days)
        {
            return 1;
        }
        return *days;
    }

    // The price is fixed here and never follows later rate changes.
    Rental create_rental(const RentalRequest &request)
    {
        if (!customers_.get(request.customer_id))
        {
            throw ReferenceError("Customer ID " + to_string(request.customer_id) +
                                 " is invalid or has been deleted");
        }

        auto car = cars_.get(request.car_id);
        if (!car)
        {
            throw ReferenceError("Car ID " + to_string(request.car_id) +
                                 " is invalid or has been deleted");
        }
        if (car->is_rented)
        {
            throw ReferenceError("Car ID " + to_string(request.car_id) + " is already rented");
        }

        auto elapsed = elapsed_days_inclusive(request.start_date, request.end_date);
        if (elapsed && *elapsed < 1)
        {
            throw ValidationError("End date " + format_date_display(request.end_date) +
                                  " is before start date " + format_date_display(request.start_date));
        }

        int64_t days = billable_days(request.start_date, request.end_date);
        if (!elapsed)
        {
            cerr << "Warning: could not compute rental period, charging one day." << endl;
        }

        Rental rental;
        rental.rental_id = request.rental_id;
        rental.customer_id = request.customer_id;
        rental.car_id = request.car_id;
        rental.start_date = request.start_date;
        rental.end_date = request.end_date;
        rental.total_price = car->daily_rate * static_cast<double>(days);

        if (verbose_)
        {
            ostringstream line;
            line << "Rental period: " << days << " day(s), " << fixed << setprecision(2)
                 << car->daily_rate << " x " << days << " = " << rental.total_price;
            cout << line.str() << endl;
        }

        rentals_.add(rental);
        mark_car_rented(request.car_id, true);

        if (verbose_)
        {
            cout << "Created rental ID " << rental.rental_id << " for car ID " << rental.car_id << "." << endl;
        }
        return rental;
    }

    // Returns the car: tombstones the rental, then frees the car.
    bool close_rental(int32_t rental_id)
    {
        auto rental = rentals_.get(rental_id);
        if (!rental)
        {
            if (verbose_)
                cerr << "Rental ID " << rental_id << " not found or already closed." << endl;
            return false;
        }

        if (!rentals_.remove(rental_id))
        {
            return false;
        }
        mark_car_rented(rental->car_id, false);

        if (verbose_)
        {
            cout << "Rental ID " << rental_id << " closed." << endl;
        }
        return true;
    }
};

#endif
