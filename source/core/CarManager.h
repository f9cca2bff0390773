#ifndef CARMANAGER_H
#define CARMANAGER_H

#include "../../include/crm_types.hpp"
#include "BinaryCodec.h"
#include "EntityStore.h"
#include <string>
#include <vector>
using namespace std;

class CarManager : public EntityStore<CarCodec>
{
public:
    explicit CarManager(const string &filename = CAR_FILE_NAME, bool verbose = true)
        : EntityStore<CarCodec>(filename, verbose) {}

    bool set_rented(int32_t car_id, bool rented)
    {
        CarPatch patch;
        patch.is_rented = rented;
        return update(car_id, patch);
    }

    bool update_daily_rate(int32_t car_id, double rate)
    {
        CarPatch patch;
        patch.daily_rate = rate;
        return update(car_id, patch);
    }

    vector<Car> get_available_cars()
    {
        vector<Car> available;
        for (const auto &car : list_active())
        {
            if (!car.is_rented)
            {
                available.push_back(car);
            }
        }
        return available;
    }
};

#endif
