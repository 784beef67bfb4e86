#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace radish {

enum class DataType {
  kInt8,
  kUInt8,
  kInt16,
  kUInt16,
  kInt32,
  kUInt32,
  kInt64,
  kUInt64,
  kFloat32,
  kFloat64,
  kString,
  kOther
};

const char* data_type_name(DataType type);
std::size_t data_type_size(DataType type);  // 0 for non-numeric types
bool is_numeric(DataType type);

template <typename T>
constexpr DataType data_type_of();

template <>
constexpr DataType data_type_of<int8_t>() { return DataType::kInt8; }
template <>
constexpr DataType data_type_of<uint8_t>() { return DataType::kUInt8; }
template <>
constexpr DataType data_type_of<int16_t>() { return DataType::kInt16; }
template <>
constexpr DataType data_type_of<uint16_t>() { return DataType::kUInt16; }
template <>
constexpr DataType data_type_of<int32_t>() { return DataType::kInt32; }
template <>
constexpr DataType data_type_of<uint32_t>() { return DataType::kUInt32; }
template <>
constexpr DataType data_type_of<int64_t>() { return DataType::kInt64; }
template <>
constexpr DataType data_type_of<uint64_t>() { return DataType::kUInt64; }
template <>
constexpr DataType data_type_of<float>() { return DataType::kFloat32; }
template <>
constexpr DataType data_type_of<double>() { return DataType::kFloat64; }

struct AttributeValue {
  DataType type = DataType::kOther;
  std::string text;            // kString
  std::vector<double> values;  // numeric types, converted to double

  bool is_text() const { return type == DataType::kString; }
  std::optional<double> as_double() const;
  std::string to_string() const;
};

struct Attribute {
  std::string name;
  AttributeValue value;
};

struct Dimension {
  std::string name;
  std::size_t size = 0;
  bool has_variable = false;  // false when no coordinate variable shares the name
};

struct VariableInfo {
  std::string name;
  DataType type = DataType::kOther;
  std::size_t string_width = 0;  // characters per row of a char array, 0 for NC_STRING
  std::vector<std::string> dims;
  std::vector<std::size_t> shape;
  std::vector<Attribute> attributes;

  const AttributeValue* attribute(const std::string& attr_name) const;
  std::size_t num_elements() const;
};

// Payload in its stored numeric type, row-major.
struct RawArray {
  DataType type = DataType::kOther;
  std::vector<std::size_t> shape;
  std::vector<std::uint8_t> bytes;

  std::size_t count() const;

  template <typename T>
  const T* as() const {
    return reinterpret_cast<const T*>(bytes.data());
  }
};

// Read session over one NetCDF container (classic, 64-bit offset or NetCDF-4)
// opened through libnetcdf. The file stays open for the lifetime of the
// object. All libnetcdf calls are serialized on a library-wide mutex because
// libnetcdf is not thread-safe.
class Container {
 public:
  static Container open(const std::string& path);
  static Container open_image(const std::vector<std::uint8_t>& image,
                              std::string label = "<memory>");

  Container(Container&& other) noexcept;
  Container& operator=(Container&& other) noexcept;
  Container(const Container&) = delete;
  Container& operator=(const Container&) = delete;
  ~Container();

  const std::string& path() const { return path_; }

  const std::vector<Attribute>& global_attributes() const { return global_attributes_; }
  const AttributeValue* global_attribute(const std::string& name) const;
  const std::vector<Dimension>& dimensions() const { return dimensions_; }
  const Dimension* dimension(const std::string& name) const;
  const std::vector<VariableInfo>& variables() const { return variables_; }
  const VariableInfo* variable(const std::string& name) const;

  RawArray read(const std::string& name) const;
  // Rows [start, start + count) of the first dimension, all of the others.
  RawArray read_rows(const std::string& name, std::size_t start, std::size_t count) const;
  std::vector<double> read_doubles(const std::string& name) const;
  std::vector<double> read_doubles(const std::string& name, std::size_t start,
                                   std::size_t count) const;
  std::vector<std::string> read_strings(const std::string& name) const;

  // Reads a variable attribute converted by libnetcdf into T; nullopt when the
  // attribute is absent or not numeric.
  template <typename T>
  std::optional<T> read_attribute_as(const std::string& variable,
                                     const std::string& attribute) const {
    T value{};
    if (!read_attribute_raw(variable, attribute, data_type_of<T>(), &value)) {
      return std::nullopt;
    }
    return value;
  }

  // Number of payload elements read so far through this container.
  std::size_t elements_read() const;

 private:
  Container(std::string path, int ncid, std::vector<std::uint8_t> image = {});

  void load_catalog();
  void close();
  const VariableInfo& require_variable(const std::string& name) const;
  std::vector<std::size_t> selection_shape(const VariableInfo& var,
                                           const std::optional<std::pair<std::size_t, std::size_t>>& rows) const;
  int varid(const VariableInfo& var) const;
  void read_selection(const VariableInfo& var,
                      const std::optional<std::pair<std::size_t, std::size_t>>& rows,
                      DataType mem_type, void* out, std::size_t elements) const;
  bool read_attribute_raw(const std::string& variable, const std::string& attribute,
                          DataType mem_type, void* out) const;

  std::string path_;
  int ncid_ = -1;
  std::vector<std::uint8_t> image_;  // backs nc_open_mem for in-memory images

  std::vector<Attribute> global_attributes_;
  std::vector<Dimension> dimensions_;
  std::vector<VariableInfo> variables_;
  std::unordered_map<std::string, std::size_t> variable_index_;

  mutable std::size_t elements_read_ = 0;
};

}  // namespace radish
