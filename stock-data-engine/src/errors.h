#pragma once

#include <stdexcept>
#include <string>

namespace sde {

/// Base for every error the engine raises on purpose.
class StockDataError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Market-data provider unreachable, failed or timed out.
class DataFetchError : public StockDataError {
public:
    using StockDataError::StockDataError;
};

/// No stored data for the requested symbol.
class NotFoundError : public StockDataError {
public:
    using StockDataError::StockDataError;
};

/// Blob store read or write failed.
class StorageError : public StockDataError {
public:
    using StockDataError::StockDataError;
};

/// Malformed stored document or request.
class ValidationError : public StockDataError {
public:
    using StockDataError::StockDataError;
};

} // namespace sde
