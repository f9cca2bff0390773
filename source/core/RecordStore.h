#ifndef RECORDSTORE_H
#define RECORDSTORE_H

#include "../../include/crm_types.hpp"
#include "../../include/crm_errors.hpp"
#include <fstream>
#include <string>
#include <vector>
#include <optional>
#include <iostream>
#include <system_error>
#include <filesystem>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

using namespace std;

// A flat file of fixed-size slots. Slot i lives at byte i * RECORD_SIZE,
// byte 0 of a slot is its active flag. There is no header and no index:
// every call scans from offset 0 and leaves the file consistent when it
// returns. A partial trailing slot is treated as end of data.
template <typename Codec>
class RecordStore
{
public:
    typedef typename Codec::record_type Record;
    typedef typename Codec::patch_type Patch;

    struct Located
    {
        Record record;
        uint64_t offset;
    };

private:
    fstream file_;
    string filename_;
    uint64_t record_size_;
    bool is_open_;
    bool verbose_;

    void ensure_open() const
    {
        if (!is_open_)
        {
            throw IOError(string(Codec::ENTITY_NAME) + " store '" + filename_ + "' is closed");
        }
    }

    void create_parent_directory()
    {
        filesystem::path parent = filesystem::path(filename_).parent_path();
        if (parent.empty())
            return;

        error_code ec;
        filesystem::create_directories(parent, ec);
        if (ec)
        {
            throw IOError("Cannot create directory '" + parent.string() + "': " + ec.message());
        }
    }

    void open()
    {
        create_parent_directory();

        file_.open(filename_, ios::in | ios::out | ios::binary);
        if (!file_.is_open())
        {
            // ios::in | ios::out never creates, so create it empty first.
            ofstream create(filename_, ios::out | ios::binary);
            if (!create.is_open())
            {
                throw IOError("Cannot create file: " + filename_);
            }
            create.close();

            file_.open(filename_, ios::in | ios::out | ios::binary);
            if (!file_.is_open())
            {
                throw IOError("Cannot open file: " + filename_);
            }
            if (verbose_)
                cout << "File '" << filename_ << "' created and opened for R/W." << endl;
        }
        else if (verbose_)
        {
            cout << "File '" << filename_ << "' opened for R/W." << endl;
        }
        is_open_ = true;
    }

    // End of the last complete slot.
    uint64_t data_end()
    {
        file_.clear();
        file_.seekg(0, ios::end);
        streamoff size = file_.tellg();
        if (size < 0)
        {
            throw IOError("Cannot determine size of " + filename_);
        }
        uint64_t bytes = static_cast<uint64_t>(size);
        return bytes - (bytes % record_size_);
    }

    void read_block(uint64_t offset, vector<uint8_t> &block)
    {
        block.resize(record_size_);
        file_.clear();
        file_.seekg(static_cast<streamoff>(offset), ios::beg);
        file_.read(reinterpret_cast<char *>(block.data()), static_cast<streamsize>(record_size_));
        if (static_cast<uint64_t>(file_.gcount()) != record_size_)
        {
            file_.clear();
            throw IOError("Short read at offset " + to_string(offset) + " in " + filename_);
        }
    }

    void write_bytes(uint64_t offset, const uint8_t *data, size_t size)
    {
        file_.clear();
        file_.seekp(static_cast<streamoff>(offset), ios::beg);
        file_.write(reinterpret_cast<const char *>(data), static_cast<streamsize>(size));
        file_.flush();
        if (!file_)
        {
            file_.clear();
            throw IOError("Write failed at offset " + to_string(offset) + " in " + filename_);
        }
    }

    // First-fit: lowest offset whose flag byte is zero, else end of data.
    // Only the flag byte of each slot is read.
    uint64_t find_free_slot(bool &reused)
    {
        uint64_t end = data_end();
        for (uint64_t offset = 0; offset < end; offset += record_size_)
        {
            file_.clear();
            file_.seekg(static_cast<streamoff>(offset), ios::beg);
            char flag = 0;
            if (!file_.read(&flag, 1))
            {
                file_.clear();
                throw IOError("Cannot read slot flag at offset " + to_string(offset) + " in " + filename_);
            }
            if (flag == 0)
            {
                reused = true;
                return offset;
            }
        }
        reused = false;
        return end;
    }

    void sync_to_disk()
    {
        int fd = ::open(filename_.c_str(), O_RDONLY);
        if (fd < 0)
        {
            throw IOError("Cannot open " + filename_ + " for sync: " + strerror(errno));
        }
        if (::fsync(fd) != 0)
        {
            int err = errno;
            ::close(fd);
            throw IOError("fsync failed for " + filename_ + ": " + strerror(err));
        }
        ::close(fd);
    }

public:
    explicit RecordStore(const string &filename, bool verbose = true)
        : filename_(filename), record_size_(Codec::RECORD_SIZE),
          is_open_(false), verbose_(verbose)
    {
        open();
    }

    RecordStore(const RecordStore &) = delete;
    RecordStore &operator=(const RecordStore &) = delete;

    ~RecordStore()
    {
        try
        {
            close();
        }
        catch (const exception &e)
        {
            cerr << "ERROR: closing " << filename_ << ": " << e.what() << endl;
        }
    }

    // ========================================================================
    // CRUD
    // ========================================================================

    // Returns the byte offset the record was written at.
    uint64_t add(Record record)
    {
        ensure_open();

        Codec::set_identity(record, Codec::id_of(record), true);
        Codec::validate(record);
        vector<uint8_t> block = Codec::encode(record);

        bool reused = false;
        uint64_t offset = find_free_slot(reused);
        write_bytes(offset, block.data(), block.size());

        if (verbose_)
        {
            if (reused)
                cout << "Reusing free space at offset: " << offset << " bytes in " << filename_ << "." << endl;
            else
                cout << "Appended new record at offset: " << offset << " bytes in " << filename_ << "." << endl;
        }
        return offset;
    }

    optional<Located> get_by_id(int32_t id)
    {
        ensure_open();

        uint64_t end = data_end();
        vector<uint8_t> block;
        for (uint64_t offset = 0; offset < end; offset += record_size_)
        {
            read_block(offset, block);
            try
            {
                Record record = Codec::decode(block);
                if (record.is_active && Codec::id_of(record) == id)
                {
                    return Located{record, offset};
                }
            }
            catch (const FormatError &)
            {
                continue;
            }
        }
        return nullopt;
    }

    // Merges the patch onto the stored record and rewrites it in place.
    // The id and active flag never change.
    bool update(int32_t id, const Patch &patch)
    {
        auto found = get_by_id(id);
        if (!found)
        {
            return false;
        }

        Record merged = found->record;
        Codec::apply(merged, patch);
        Codec::set_identity(merged, id, found->record.is_active);
        Codec::validate(merged);

        vector<uint8_t> block = Codec::encode(merged);
        write_bytes(found->offset, block.data(), block.size());
        return true;
    }

    // Clears the flag byte only; the payload stays until the slot is reused.
    bool remove(int32_t id)
    {
        auto found = get_by_id(id);
        if (!found)
        {
            return false;
        }

        const uint8_t inactive = 0;
        write_bytes(found->offset, &inactive, 1);
        return true;
    }

    vector<Record> get_all()
    {
        vector<Record> records;
        for (auto &slot : scan_all())
        {
            if (slot.record.is_active)
            {
                records.push_back(slot.record);
            }
        }
        return records;
    }

    // Every decodable slot, active or not, in offset order.
    vector<Located> scan_all()
    {
        ensure_open();

        vector<Located> slots;
        uint64_t end = data_end();
        vector<uint8_t> block;
        for (uint64_t offset = 0; offset < end; offset += record_size_)
        {
            read_block(offset, block);
            try
            {
                slots.push_back(Located{Codec::decode(block), offset});
            }
            catch (const FormatError &)
            {
                continue;
            }
        }
        return slots;
    }

    uint64_t slot_count()
    {
        ensure_open();
        return data_end() / record_size_;
    }

    // Flush, fsync, release. A second call does nothing.
    void close()
    {
        if (!is_open_)
        {
            return;
        }
        is_open_ = false;

        file_.clear();
        file_.flush();
        if (!file_)
        {
            file_.close();
            throw IOError("Flush failed for " + filename_);
        }

        // The stream is released whether or not the sync succeeds.
        try
        {
            sync_to_disk();
        }
        catch (const IOError &)
        {
            file_.close();
            throw;
        }
        file_.close();
    }

    bool is_open() const { return is_open_; }
    const string &filename() const { return filename_; }
    uint64_t record_size() const { return record_size_; }
};

#endif
