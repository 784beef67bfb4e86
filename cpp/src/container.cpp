#include "radish/container.hpp"

#include "radish/error.hpp"
#include "radish/event_log.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>

#include <netcdf.h>

namespace radish {

namespace {

std::recursive_mutex& netcdf_mutex() {
  static std::recursive_mutex mutex;
  return mutex;
}

std::string nc_message(int status) { return nc_strerror(status); }

DataType classify_type(nc_type type) {
  switch (type) {
    case NC_BYTE:
      return DataType::kInt8;
    case NC_UBYTE:
      return DataType::kUInt8;
    case NC_SHORT:
      return DataType::kInt16;
    case NC_USHORT:
      return DataType::kUInt16;
    case NC_INT:
      return DataType::kInt32;
    case NC_UINT:
      return DataType::kUInt32;
    case NC_INT64:
      return DataType::kInt64;
    case NC_UINT64:
      return DataType::kUInt64;
    case NC_FLOAT:
      return DataType::kFloat32;
    case NC_DOUBLE:
      return DataType::kFloat64;
    case NC_CHAR:
    case NC_STRING:
      return DataType::kString;
    default:
      return DataType::kOther;
  }
}

// Character arrays are NUL padded by writers and frequently blank padded by
// Fortran-era tools.
std::string trim_fixed(const char* start, std::size_t width) {
  std::size_t len = 0;
  while (len < width && start[len] != '\0') {
    ++len;
  }
  while (len > 0 && start[len - 1] == ' ') {
    --len;
  }
  return std::string(start, len);
}

// Text attributes are kept verbatim up to the first NUL.
std::string until_nul(const char* start, std::size_t width) {
  std::size_t len = 0;
  while (len < width && start[len] != '\0') {
    ++len;
  }
  return std::string(start, len);
}

AttributeValue read_attribute_value(int ncid, int varid, const char* name) {
  AttributeValue value;
  nc_type xtype = NC_NAT;
  std::size_t len = 0;
  if (nc_inq_att(ncid, varid, name, &xtype, &len) != NC_NOERR) {
    return value;
  }
  value.type = classify_type(xtype);

  if (xtype == NC_CHAR) {
    std::vector<char> raw(len, '\0');
    if (len > 0 && nc_get_att_text(ncid, varid, name, raw.data()) == NC_NOERR) {
      value.text = until_nul(raw.data(), raw.size());
    }
    return value;
  }
  if (xtype == NC_STRING) {
    std::vector<char*> raw(len, nullptr);
    if (len > 0 && nc_get_att_string(ncid, varid, name, raw.data()) == NC_NOERR) {
      for (std::size_t i = 0; i < raw.size(); ++i) {
        if (i > 0) {
          value.text += ",";
        }
        value.text += raw[i] ? raw[i] : "";
      }
      nc_free_string(len, raw.data());
    }
    return value;
  }

  if (is_numeric(value.type) && len > 0) {
    value.values.resize(len);
    if (nc_get_att_double(ncid, varid, name, value.values.data()) != NC_NOERR) {
      value.values.clear();
    }
  }
  return value;
}

std::vector<Attribute> read_attributes(int ncid, int varid, int natts) {
  std::vector<Attribute> out;
  out.reserve(static_cast<std::size_t>(std::max(natts, 0)));
  char name[NC_MAX_NAME + 1];
  for (int i = 0; i < natts; ++i) {
    if (nc_inq_attname(ncid, varid, i, name) != NC_NOERR) {
      continue;
    }
    out.push_back({name, read_attribute_value(ncid, varid, name)});
  }
  return out;
}

// Whole-variable read when start is null, hyperslab otherwise; libnetcdf
// converts the stored type to the requested memory type.
int get_values(int ncid, int varid, const std::size_t* start, const std::size_t* count,
               DataType mem_type, void* out) {
  switch (mem_type) {
    case DataType::kInt8:
      return start ? nc_get_vara_schar(ncid, varid, start, count, static_cast<signed char*>(out))
                   : nc_get_var_schar(ncid, varid, static_cast<signed char*>(out));
    case DataType::kUInt8:
      return start ? nc_get_vara_uchar(ncid, varid, start, count, static_cast<unsigned char*>(out))
                   : nc_get_var_uchar(ncid, varid, static_cast<unsigned char*>(out));
    case DataType::kInt16:
      return start ? nc_get_vara_short(ncid, varid, start, count, static_cast<short*>(out))
                   : nc_get_var_short(ncid, varid, static_cast<short*>(out));
    case DataType::kUInt16:
      return start ? nc_get_vara_ushort(ncid, varid, start, count,
                                        static_cast<unsigned short*>(out))
                   : nc_get_var_ushort(ncid, varid, static_cast<unsigned short*>(out));
    case DataType::kInt32:
      return start ? nc_get_vara_int(ncid, varid, start, count, static_cast<int*>(out))
                   : nc_get_var_int(ncid, varid, static_cast<int*>(out));
    case DataType::kUInt32:
      return start ? nc_get_vara_uint(ncid, varid, start, count, static_cast<unsigned int*>(out))
                   : nc_get_var_uint(ncid, varid, static_cast<unsigned int*>(out));
    case DataType::kInt64:
      return start ? nc_get_vara_longlong(ncid, varid, start, count, static_cast<long long*>(out))
                   : nc_get_var_longlong(ncid, varid, static_cast<long long*>(out));
    case DataType::kUInt64:
      return start ? nc_get_vara_ulonglong(ncid, varid, start, count,
                                           static_cast<unsigned long long*>(out))
                   : nc_get_var_ulonglong(ncid, varid, static_cast<unsigned long long*>(out));
    case DataType::kFloat32:
      return start ? nc_get_vara_float(ncid, varid, start, count, static_cast<float*>(out))
                   : nc_get_var_float(ncid, varid, static_cast<float*>(out));
    case DataType::kFloat64:
      return start ? nc_get_vara_double(ncid, varid, start, count, static_cast<double*>(out))
                   : nc_get_var_double(ncid, varid, static_cast<double*>(out));
    default:
      return NC_EBADTYPE;
  }
}

int get_attribute(int ncid, int varid, const char* name, DataType mem_type, void* out) {
  switch (mem_type) {
    case DataType::kInt8:
      return nc_get_att_schar(ncid, varid, name, static_cast<signed char*>(out));
    case DataType::kUInt8:
      return nc_get_att_uchar(ncid, varid, name, static_cast<unsigned char*>(out));
    case DataType::kInt16:
      return nc_get_att_short(ncid, varid, name, static_cast<short*>(out));
    case DataType::kUInt16:
      return nc_get_att_ushort(ncid, varid, name, static_cast<unsigned short*>(out));
    case DataType::kInt32:
      return nc_get_att_int(ncid, varid, name, static_cast<int*>(out));
    case DataType::kUInt32:
      return nc_get_att_uint(ncid, varid, name, static_cast<unsigned int*>(out));
    case DataType::kInt64:
      return nc_get_att_longlong(ncid, varid, name, static_cast<long long*>(out));
    case DataType::kUInt64:
      return nc_get_att_ulonglong(ncid, varid, name, static_cast<unsigned long long*>(out));
    case DataType::kFloat32:
      return nc_get_att_float(ncid, varid, name, static_cast<float*>(out));
    case DataType::kFloat64:
      return nc_get_att_double(ncid, varid, name, static_cast<double*>(out));
    default:
      return NC_EBADTYPE;
  }
}

}  // namespace

const char* data_type_name(DataType type) {
  switch (type) {
    case DataType::kInt8:
      return "int8";
    case DataType::kUInt8:
      return "uint8";
    case DataType::kInt16:
      return "int16";
    case DataType::kUInt16:
      return "uint16";
    case DataType::kInt32:
      return "int32";
    case DataType::kUInt32:
      return "uint32";
    case DataType::kInt64:
      return "int64";
    case DataType::kUInt64:
      return "uint64";
    case DataType::kFloat32:
      return "float32";
    case DataType::kFloat64:
      return "float64";
    case DataType::kString:
      return "string";
    case DataType::kOther:
      break;
  }
  return "unknown";
}

std::size_t data_type_size(DataType type) {
  switch (type) {
    case DataType::kInt8:
    case DataType::kUInt8:
      return 1;
    case DataType::kInt16:
    case DataType::kUInt16:
      return 2;
    case DataType::kInt32:
    case DataType::kUInt32:
    case DataType::kFloat32:
      return 4;
    case DataType::kInt64:
    case DataType::kUInt64:
    case DataType::kFloat64:
      return 8;
    default:
      return 0;
  }
}

bool is_numeric(DataType type) { return data_type_size(type) > 0; }

std::optional<double> AttributeValue::as_double() const {
  if (is_numeric(type) && !values.empty()) {
    return values.front();
  }
  return std::nullopt;
}

std::string AttributeValue::to_string() const {
  if (is_text()) {
    return text;
  }
  std::ostringstream os;
  os.precision(17);
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      os << ",";
    }
    const double v = values[i];
    if (type != DataType::kFloat32 && type != DataType::kFloat64 && std::isfinite(v)) {
      os << static_cast<long long>(v);
    } else {
      os << v;
    }
  }
  return os.str();
}

const AttributeValue* VariableInfo::attribute(const std::string& attr_name) const {
  for (const auto& attr : attributes) {
    if (attr.name == attr_name) {
      return &attr.value;
    }
  }
  return nullptr;
}

std::size_t VariableInfo::num_elements() const {
  std::size_t n = 1;
  for (auto extent : shape) {
    n *= extent;
  }
  return n;
}

std::size_t RawArray::count() const {
  const std::size_t width = data_type_size(type);
  return width == 0 ? 0 : bytes.size() / width;
}

Container::Container(std::string path, int ncid, std::vector<std::uint8_t> image)
    : path_(std::move(path)), ncid_(ncid), image_(std::move(image)) {}

Container Container::open(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    throw NotFoundError(path, "file does not exist");
  }
  if (std::filesystem::is_directory(path, ec)) {
    throw NotFoundError(path, "path is a directory");
  }
  {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      throw NotFoundError(path, "file cannot be opened for reading");
    }
  }

  std::lock_guard<std::recursive_mutex> lock(netcdf_mutex());
  int ncid = -1;
  const int status = nc_open(path.c_str(), NC_NOWRITE, &ncid);
  if (status != NC_NOERR) {
    throw FormatError(path, "not a NetCDF container: " + nc_message(status));
  }
  Container container(path, ncid);
  container.load_catalog();
  return container;
}

Container Container::open_image(const std::vector<std::uint8_t>& image, std::string label) {
  if (image.empty()) {
    throw FormatError(label, "empty file image");
  }
  std::lock_guard<std::recursive_mutex> lock(netcdf_mutex());
  // nc_open_mem reads from the caller's buffer for as long as the file is
  // open, so the container keeps its own copy.
  std::vector<std::uint8_t> copy = image;
  int ncid = -1;
  const int status = nc_open_mem(label.c_str(), NC_NOWRITE, copy.size(), copy.data(), &ncid);
  if (status != NC_NOERR) {
    throw FormatError(label, "file image is not a NetCDF container: " + nc_message(status));
  }
  Container container(std::move(label), ncid, std::move(copy));
  container.load_catalog();
  return container;
}

Container::Container(Container&& other) noexcept
    : path_(std::move(other.path_)),
      ncid_(other.ncid_),
      image_(std::move(other.image_)),
      global_attributes_(std::move(other.global_attributes_)),
      dimensions_(std::move(other.dimensions_)),
      variables_(std::move(other.variables_)),
      variable_index_(std::move(other.variable_index_)),
      elements_read_(other.elements_read_) {
  other.ncid_ = -1;
}

Container& Container::operator=(Container&& other) noexcept {
  if (this != &other) {
    close();
    path_ = std::move(other.path_);
    ncid_ = other.ncid_;
    image_ = std::move(other.image_);
    global_attributes_ = std::move(other.global_attributes_);
    dimensions_ = std::move(other.dimensions_);
    variables_ = std::move(other.variables_);
    variable_index_ = std::move(other.variable_index_);
    elements_read_ = other.elements_read_;
    other.ncid_ = -1;
  }
  return *this;
}

Container::~Container() { close(); }

void Container::close() {
  if (ncid_ < 0) {
    return;
  }
  std::lock_guard<std::recursive_mutex> lock(netcdf_mutex());
  const int status = nc_close(ncid_);
  if (status != NC_NOERR) {
    log_verbose("Container", "closing " + path_ + ": " + nc_message(status));
  }
  ncid_ = -1;
}

void Container::load_catalog() {
  int ndims = 0;
  int nvars = 0;
  int ngatts = 0;
  int unlimited = -1;
  int status = nc_inq(ncid_, &ndims, &nvars, &ngatts, &unlimited);
  if (status != NC_NOERR) {
    throw FormatError(path_, "failed to list the root group: " + nc_message(status));
  }
  global_attributes_ = read_attributes(ncid_, NC_GLOBAL, ngatts);

  std::vector<int> dimids(static_cast<std::size_t>(std::max(ndims, 0)), 0);
  if (ndims > 0) {
    status = nc_inq_dimids(ncid_, &ndims, dimids.data(), 0);
    if (status != NC_NOERR) {
      throw FormatError(path_, "failed to list dimensions: " + nc_message(status));
    }
  }
  std::unordered_map<int, std::size_t> dim_position;
  char name[NC_MAX_NAME + 1];
  for (int dimid : dimids) {
    std::size_t len = 0;
    status = nc_inq_dim(ncid_, dimid, name, &len);
    if (status != NC_NOERR) {
      throw FormatError(path_, "failed to query dimension: " + nc_message(status));
    }
    dim_position[dimid] = dimensions_.size();
    dimensions_.push_back({name, len, false});
  }

  for (int varid = 0; varid < nvars; ++varid) {
    nc_type xtype = NC_NAT;
    int rank = 0;
    int natts = 0;
    int var_dims[NC_MAX_VAR_DIMS];
    status = nc_inq_var(ncid_, varid, name, &xtype, &rank, var_dims, &natts);
    if (status != NC_NOERR) {
      throw FormatError(path_, "failed to query variable: " + nc_message(status));
    }

    VariableInfo var;
    var.name = name;
    var.type = classify_type(xtype);
    if (var.type == DataType::kOther) {
      log_verbose("Container", "variable '" + var.name + "' in " + path_ +
                                   " has an unsupported type and cannot be read");
    }
    for (int d = 0; d < rank; ++d) {
      auto it = dim_position.find(var_dims[d]);
      if (it == dim_position.end()) {
        throw FormatError(path_, "variable '" + var.name + "' uses an unknown dimension");
      }
      var.dims.push_back(dimensions_[it->second].name);
      var.shape.push_back(dimensions_[it->second].size);
    }
    if (xtype == NC_CHAR) {
      var.string_width = var.shape.empty() ? 1 : var.shape.back();
    }
    if (rank == 1 && var.dims.front() == var.name) {
      dimensions_[dim_position[var_dims[0]]].has_variable = true;
    }
    var.attributes = read_attributes(ncid_, varid, natts);

    variable_index_[var.name] = variables_.size();
    variables_.push_back(std::move(var));
  }
}

const AttributeValue* Container::global_attribute(const std::string& name) const {
  for (const auto& attr : global_attributes_) {
    if (attr.name == name) {
      return &attr.value;
    }
  }
  return nullptr;
}

const Dimension* Container::dimension(const std::string& name) const {
  for (const auto& dim : dimensions_) {
    if (dim.name == name) {
      return &dim;
    }
  }
  return nullptr;
}

const VariableInfo* Container::variable(const std::string& name) const {
  auto it = variable_index_.find(name);
  if (it == variable_index_.end()) {
    return nullptr;
  }
  return &variables_[it->second];
}

const VariableInfo& Container::require_variable(const std::string& name) const {
  const VariableInfo* var = variable(name);
  if (var == nullptr) {
    throw SchemaError(path_, "required variable is missing", name);
  }
  return *var;
}

int Container::varid(const VariableInfo& var) const {
  int id = -1;
  const int status = nc_inq_varid(ncid_, var.name.c_str(), &id);
  if (status != NC_NOERR) {
    throw DecodeError(path_, "failed to look up variable: " + nc_message(status), var.name);
  }
  return id;
}

std::vector<std::size_t> Container::selection_shape(
    const VariableInfo& var, const std::optional<std::pair<std::size_t, std::size_t>>& rows) const {
  std::vector<std::size_t> shape = var.shape;
  if (rows.has_value()) {
    if (shape.empty()) {
      throw DecodeError(path_, "cannot take a row slice of a scalar variable", var.name);
    }
    const auto [start, count] = *rows;
    if (start > shape[0] || count > shape[0] - start) {
      std::ostringstream os;
      os << "row range [" << start << ", " << start + count << ") exceeds extent " << shape[0];
      throw DecodeError(path_, os.str(), var.name);
    }
    shape[0] = count;
  }
  return shape;
}

void Container::read_selection(const VariableInfo& var,
                               const std::optional<std::pair<std::size_t, std::size_t>>& rows,
                               DataType mem_type, void* out, std::size_t elements) const {
  if (elements == 0) {
    return;
  }
  const int id = varid(var);

  int status = NC_NOERR;
  if (!rows.has_value()) {
    status = get_values(ncid_, id, nullptr, nullptr, mem_type, out);
  } else {
    const std::size_t rank = var.shape.size();
    std::vector<std::size_t> start(rank, 0);
    std::vector<std::size_t> count(var.shape);
    start[0] = rows->first;
    count[0] = rows->second;
    status = get_values(ncid_, id, start.data(), count.data(), mem_type, out);
  }
  if (status != NC_NOERR) {
    throw DecodeError(path_, "NetCDF read failed: " + nc_message(status), var.name);
  }
  elements_read_ += elements;
}

RawArray Container::read(const std::string& name) const {
  std::lock_guard<std::recursive_mutex> lock(netcdf_mutex());
  const VariableInfo& var = require_variable(name);
  if (!is_numeric(var.type)) {
    throw DecodeError(path_, std::string("variable has non-numeric type ") +
                                 data_type_name(var.type), name);
  }
  RawArray out;
  out.type = var.type;
  out.shape = selection_shape(var, std::nullopt);
  const std::size_t elements = var.num_elements();
  out.bytes.resize(elements * data_type_size(var.type));
  read_selection(var, std::nullopt, var.type, out.bytes.data(), elements);
  return out;
}

RawArray Container::read_rows(const std::string& name, std::size_t start, std::size_t count) const {
  std::lock_guard<std::recursive_mutex> lock(netcdf_mutex());
  const VariableInfo& var = require_variable(name);
  if (!is_numeric(var.type)) {
    throw DecodeError(path_, std::string("variable has non-numeric type ") +
                                 data_type_name(var.type), name);
  }
  const auto rows = std::make_optional(std::make_pair(start, count));
  RawArray out;
  out.type = var.type;
  out.shape = selection_shape(var, rows);
  std::size_t elements = 1;
  for (auto extent : out.shape) {
    elements *= extent;
  }
  out.bytes.resize(elements * data_type_size(var.type));
  read_selection(var, rows, var.type, out.bytes.data(), elements);
  return out;
}

std::vector<double> Container::read_doubles(const std::string& name) const {
  std::lock_guard<std::recursive_mutex> lock(netcdf_mutex());
  const VariableInfo& var = require_variable(name);
  if (!is_numeric(var.type)) {
    throw DecodeError(path_, std::string("variable has non-numeric type ") +
                                 data_type_name(var.type), name);
  }
  std::vector<double> out(var.num_elements(), 0.0);
  read_selection(var, std::nullopt, DataType::kFloat64, out.data(), out.size());
  return out;
}

std::vector<double> Container::read_doubles(const std::string& name, std::size_t start,
                                            std::size_t count) const {
  std::lock_guard<std::recursive_mutex> lock(netcdf_mutex());
  const VariableInfo& var = require_variable(name);
  if (!is_numeric(var.type)) {
    throw DecodeError(path_, std::string("variable has non-numeric type ") +
                                 data_type_name(var.type), name);
  }
  const auto rows = std::make_optional(std::make_pair(start, count));
  std::size_t elements = 1;
  for (auto extent : selection_shape(var, rows)) {
    elements *= extent;
  }
  std::vector<double> out(elements, 0.0);
  read_selection(var, rows, DataType::kFloat64, out.data(), out.size());
  return out;
}

std::vector<std::string> Container::read_strings(const std::string& name) const {
  std::lock_guard<std::recursive_mutex> lock(netcdf_mutex());
  const VariableInfo& var = require_variable(name);
  if (var.type != DataType::kString) {
    throw DecodeError(path_, "variable is not a character or string variable", name);
  }

  std::vector<std::string> out;
  const std::size_t total = var.num_elements();
  if (total == 0) {
    return out;
  }
  const int id = varid(var);

  if (var.string_width == 0) {
    std::vector<char*> raw(total, nullptr);
    const int status = nc_get_var_string(ncid_, id, raw.data());
    if (status != NC_NOERR) {
      throw DecodeError(path_, "NetCDF read failed: " + nc_message(status), name);
    }
    out.reserve(raw.size());
    for (auto* s : raw) {
      out.emplace_back(s ? s : "");
    }
    nc_free_string(raw.size(), raw.data());
  } else {
    std::vector<char> raw(total, '\0');
    const int status = nc_get_var_text(ncid_, id, raw.data());
    if (status != NC_NOERR) {
      throw DecodeError(path_, "NetCDF read failed: " + nc_message(status), name);
    }
    // Character arrays keep the string length in their last dimension.
    const std::size_t row_width = var.string_width;
    const std::size_t rows = raw.size() / row_width;
    out.reserve(rows);
    for (std::size_t r = 0; r < rows; ++r) {
      out.push_back(trim_fixed(raw.data() + r * row_width, row_width));
    }
  }
  elements_read_ += out.size();
  return out;
}

bool Container::read_attribute_raw(const std::string& variable, const std::string& attribute,
                                   DataType mem_type, void* out) const {
  std::lock_guard<std::recursive_mutex> lock(netcdf_mutex());
  const VariableInfo* var = this->variable(variable);
  if (var == nullptr) {
    return false;
  }
  const AttributeValue* value = var->attribute(attribute);
  if (value == nullptr || !is_numeric(value->type) || value->values.size() != 1) {
    return false;
  }
  int id = -1;
  if (nc_inq_varid(ncid_, variable.c_str(), &id) != NC_NOERR) {
    return false;
  }
  return get_attribute(ncid_, id, attribute.c_str(), mem_type, out) == NC_NOERR;
}

std::size_t Container::elements_read() const {
  std::lock_guard<std::recursive_mutex> lock(netcdf_mutex());
  return elements_read_;
}

}  // namespace radish
