#ifndef CUSTOMERMANAGER_H
#define CUSTOMERMANAGER_H

#include "../../include/crm_types.hpp"
#include "BinaryCodec.h"
#include "EntityStore.h"
#include <string>
using namespace std;

class CustomerManager : public EntityStore<CustomerCodec>
{
public:
    explicit CustomerManager(const string &filename = CUSTOMER_FILE_NAME, bool verbose = true)
        : EntityStore<CustomerCodec>(filename, verbose) {}

    bool update_phone(int32_t customer_id, const string &phone)
    {
        CustomerPatch patch;
        patch.phone = phone;
        return update(customer_id, patch);
    }
};

#endif
