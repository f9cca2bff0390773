#ifndef CRM_ERRORS_HPP
#define CRM_ERRORS_HPP

#include <stdexcept>
#include <string>
using namespace std;

// A slot whose bytes do not decode. Scans skip it.
class FormatError : public runtime_error
{
public:
    explicit FormatError(const string &message) : runtime_error(message) {}
};

// A record rejected before anything was written.
class ValidationError : public runtime_error
{
public:
    explicit ValidationError(const string &message) : runtime_error(message) {}
};

// Open, seek, read, write, flush or sync failure, or use of a closed store.
class IOError : public runtime_error
{
public:
    explicit IOError(const string &message) : runtime_error(message) {}
};

// A rental naming a customer or car that is not available.
class ReferenceError : public runtime_error
{
public:
    explicit ReferenceError(const string &message) : runtime_error(message) {}
};

#endif
