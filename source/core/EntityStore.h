#ifndef ENTITYSTORE_H
#define ENTITYSTORE_H

#include "../../include/crm_types.hpp"
#include "../../include/crm_errors.hpp"
#include "RecordStore.h"
#include <string>
#include <vector>
#include <optional>
#include <iostream>
using namespace std;

// The record CRUD contract menus and reports call into. Records are
// addressed by logical id only; offsets are reported, never accepted.
template <typename Codec>
class EntityStore
{
public:
    typedef typename Codec::record_type Record;
    typedef typename Codec::patch_type Patch;
    typedef typename RecordStore<Codec>::Located Located;

protected:
    RecordStore<Codec> store_;
    bool verbose_;

public:
    EntityStore(const string &filename, bool verbose)
        : store_(filename, verbose), verbose_(verbose) {}

    // Rejects invalid fields and ids already held by an active record
    // before anything is written.
    uint64_t add(const Record &record)
    {
        Codec::validate(record);

        int32_t id = Codec::id_of(record);
        if (store_.get_by_id(id))
        {
            throw ValidationError(string(Codec::ENTITY_NAME) + " ID " + to_string(id) +
                                  " already exists in " + store_.filename());
        }
        return store_.add(record);
    }

    optional<Record> get(int32_t id)
    {
        auto found = store_.get_by_id(id);
        if (!found)
        {
            return nullopt;
        }
        return found->record;
    }

    optional<Located> find(int32_t id)
    {
        return store_.get_by_id(id);
    }

    bool update(int32_t id, const Patch &patch)
    {
        if (!store_.update(id, patch))
        {
            if (verbose_)
                cerr << "Error: ID " << id << " not found or is inactive in " << store_.filename() << "." << endl;
            return false;
        }
        if (verbose_)
            cout << "Successfully updated ID " << id << " in " << store_.filename() << "." << endl;
        return true;
    }

    bool remove(int32_t id)
    {
        if (!store_.remove(id))
        {
            if (verbose_)
                cerr << "Error: ID " << id << " not found or already deleted in " << store_.filename() << "." << endl;
            return false;
        }
        if (verbose_)
            cout << "Soft deleted ID " << id << " in " << store_.filename() << "." << endl;
        return true;
    }

    vector<Record> list_active()
    {
        return store_.get_all();
    }

    vector<Located> scan_all()
    {
        return store_.scan_all();
    }

    uint64_t slot_count()
    {
        return store_.slot_count();
    }

    void close()
    {
        store_.close();
    }

    bool is_open() const { return store_.is_open(); }
    const string &filename() const { return store_.filename(); }
};

#endif
