#include "gridstore_client/document.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <vector>

namespace gridstore_client {

// ============================================================================
// Value construction
// ============================================================================

Value MakeString(const std::string& s) {
    Value v;
    v.set_string_value(s);
    return v;
}

Value MakeBytes(const std::string& b) {
    Value v;
    v.set_bytes_value(b);
    return v;
}

Value MakeInt(int64_t i) {
    Value v;
    v.set_int_value(i);
    return v;
}

Value MakeDouble(double d) {
    Value v;
    v.set_double_value(d);
    return v;
}

Value MakeBool(bool b) {
    Value v;
    v.set_bool_value(b);
    return v;
}

Value MakeDocument(const Document& d) {
    Value v;
    *v.mutable_document_value() = d;
    return v;
}

// ============================================================================
// Field access
// ============================================================================

void SetField(Document& doc, const std::string& field, const Value& value) {
    (*doc.mutable_fields())[field] = value;
}

bool HasField(const Document& doc, const std::string& field) {
    return doc.fields().find(field) != doc.fields().end();
}

std::optional<std::string> GetString(const Document& doc, const std::string& field) {
    auto it = doc.fields().find(field);
    if (it == doc.fields().end() || it->second.kind_case() != Value::kStringValue) {
        return std::nullopt;
    }
    return it->second.string_value();
}

std::optional<std::string> GetBytes(const Document& doc, const std::string& field) {
    auto it = doc.fields().find(field);
    if (it == doc.fields().end() || it->second.kind_case() != Value::kBytesValue) {
        return std::nullopt;
    }
    return it->second.bytes_value();
}

std::optional<int64_t> GetInt(const Document& doc, const std::string& field) {
    auto it = doc.fields().find(field);
    if (it == doc.fields().end()) {
        return std::nullopt;
    }
    const Value& v = it->second;
    if (v.kind_case() == Value::kIntValue) {
        return v.int_value();
    }
    if (v.kind_case() == Value::kDoubleValue &&
        std::floor(v.double_value()) == v.double_value()) {
        return static_cast<int64_t>(v.double_value());
    }
    return std::nullopt;
}

std::optional<Document> GetDocument(const Document& doc, const std::string& field) {
    auto it = doc.fields().find(field);
    if (it == doc.fields().end() || it->second.kind_case() != Value::kDocumentValue) {
        return std::nullopt;
    }
    return it->second.document_value();
}

// ============================================================================
// Comparison
// ============================================================================

namespace {

template <typename T>
int Compare3(const T& a, const T& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

bool IsNumeric(const Value& v) {
    return v.kind_case() == Value::kIntValue || v.kind_case() == Value::kDoubleValue;
}

double AsDouble(const Value& v) {
    return v.kind_case() == Value::kIntValue ? static_cast<double>(v.int_value())
                                             : v.double_value();
}

std::vector<std::string> SortedKeys(const Document& d) {
    std::vector<std::string> keys;
    keys.reserve(d.fields().size());
    for (const auto& kv : d.fields()) {
        keys.push_back(kv.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

int CompareDocuments(const Document& a, const Document& b) {
    auto ka = SortedKeys(a);
    auto kb = SortedKeys(b);
    size_t n = std::min(ka.size(), kb.size());
    for (size_t i = 0; i < n; ++i) {
        int c = Compare3(ka[i], kb[i]);
        if (c != 0) return c;
        c = CompareValues(a.fields().at(ka[i]), b.fields().at(kb[i]));
        if (c != 0) return c;
    }
    return Compare3(ka.size(), kb.size());
}

void AppendValue(std::ostringstream& ss, const Value& v) {
    switch (v.kind_case()) {
        case Value::kBoolValue:
            ss << (v.bool_value() ? "true" : "false");
            break;
        case Value::kIntValue:
            ss << v.int_value();
            break;
        case Value::kDoubleValue:
            ss << v.double_value();
            break;
        case Value::kStringValue:
            ss << '"' << v.string_value() << '"';
            break;
        case Value::kBytesValue:
            ss << "<" << v.bytes_value().size() << " bytes>";
            break;
        case Value::kDocumentValue:
            ss << DebugString(v.document_value());
            break;
        default:
            ss << "null";
    }
}

}  // namespace

int CompareValues(const Value& a, const Value& b) {
    if (IsNumeric(a) && IsNumeric(b)) {
        if (a.kind_case() == Value::kIntValue && b.kind_case() == Value::kIntValue) {
            return Compare3(a.int_value(), b.int_value());
        }
        return Compare3(AsDouble(a), AsDouble(b));
    }
    if (a.kind_case() != b.kind_case()) {
        return Compare3(static_cast<int>(a.kind_case()), static_cast<int>(b.kind_case()));
    }
    switch (a.kind_case()) {
        case Value::kBoolValue:
            return Compare3(a.bool_value(), b.bool_value());
        case Value::kStringValue:
            return Compare3(a.string_value(), b.string_value());
        case Value::kBytesValue:
            return Compare3(a.bytes_value(), b.bytes_value());
        case Value::kDocumentValue:
            return CompareDocuments(a.document_value(), b.document_value());
        default:
            return 0;
    }
}

bool ValuesEqual(const Value& a, const Value& b) {
    return CompareValues(a, b) == 0;
}

bool Matches(const Document& doc, const Document& filter) {
    for (const auto& kv : filter.fields()) {
        auto it = doc.fields().find(kv.first);
        if (it == doc.fields().end() || !ValuesEqual(it->second, kv.second)) {
            return false;
        }
    }
    return true;
}

std::string DebugString(const Document& doc) {
    std::ostringstream ss;
    ss << "{";
    bool first = true;
    for (const auto& key : SortedKeys(doc)) {
        if (!first) ss << ", ";
        first = false;
        ss << key << ": ";
        AppendValue(ss, doc.fields().at(key));
    }
    ss << "}";
    return ss.str();
}

}  // namespace gridstore_client
