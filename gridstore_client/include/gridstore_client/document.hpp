#pragma once

#include "gridstore_service/gridstore.pb.h"
#include <cstdint>
#include <optional>
#include <string>

namespace gridstore_client {

using Document = gridstore_service::Document;
using Value = gridstore_service::Value;
using Query = gridstore_service::Query;

// Reserved field holding a document's unique identifier
constexpr const char* kIdField = "_id";

// ============================================================================
// Value construction
// ============================================================================
Value MakeString(const std::string& s);
Value MakeBytes(const std::string& b);
Value MakeInt(int64_t i);
Value MakeDouble(double d);
Value MakeBool(bool b);
Value MakeDocument(const Document& d);

// ============================================================================
// Field access
// ============================================================================
void SetField(Document& doc, const std::string& field, const Value& value);
bool HasField(const Document& doc, const std::string& field);

// Typed getters return std::nullopt when the field is missing or has
// another kind. GetInt also accepts a double holding an integral value.
std::optional<std::string> GetString(const Document& doc, const std::string& field);
std::optional<std::string> GetBytes(const Document& doc, const std::string& field);
std::optional<int64_t> GetInt(const Document& doc, const std::string& field);
std::optional<Document> GetDocument(const Document& doc, const std::string& field);

// ============================================================================
// Comparison
// ============================================================================

/**
 * Total order over values used for sorting.
 * Values of different kinds order by kind (null first), values of the
 * same kind by their natural order. Documents compare by encoded size
 * then byte content, which is stable but not meaningful.
 *
 * @return negative, zero or positive like strcmp
 */
int CompareValues(const Value& a, const Value& b);

bool ValuesEqual(const Value& a, const Value& b);

// True when every field of filter is present in doc with an equal value.
// An empty filter matches everything.
bool Matches(const Document& doc, const Document& filter);

// Single-line rendering for logs
std::string DebugString(const Document& doc);

}  // namespace gridstore_client
