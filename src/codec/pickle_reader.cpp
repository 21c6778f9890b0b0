/**
 * @file pickle_reader.cpp
 * @brief Restricted pickle virtual machine
 */

#include "codec/pickle_reader.h"

#include <cstdint>
#include <cstdio>
#include <exception>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

#include "codec/dtype.h"

namespace casereader::codec {

namespace {

// Opcodes (pickletools naming)
constexpr uint8_t kMark = '(';
constexpr uint8_t kStop = '.';
constexpr uint8_t kPop = '0';
constexpr uint8_t kPopMark = '1';
constexpr uint8_t kDup = '2';
constexpr uint8_t kFloat = 'F';
constexpr uint8_t kInt = 'I';
constexpr uint8_t kBinInt = 'J';
constexpr uint8_t kBinInt1 = 'K';
constexpr uint8_t kLong = 'L';
constexpr uint8_t kBinInt2 = 'M';
constexpr uint8_t kNone = 'N';
constexpr uint8_t kReduce = 'R';
constexpr uint8_t kBinString = 'T';
constexpr uint8_t kShortBinString = 'U';
constexpr uint8_t kBinUnicode = 'X';
constexpr uint8_t kAppend = 'a';
constexpr uint8_t kBuild = 'b';
constexpr uint8_t kGlobal = 'c';
constexpr uint8_t kDict = 'd';
constexpr uint8_t kEmptyDict = '}';
constexpr uint8_t kAppends = 'e';
constexpr uint8_t kGet = 'g';
constexpr uint8_t kBinGet = 'h';
constexpr uint8_t kLongBinGet = 'j';
constexpr uint8_t kList = 'l';
constexpr uint8_t kEmptyList = ']';
constexpr uint8_t kPut = 'p';
constexpr uint8_t kBinPut = 'q';
constexpr uint8_t kLongBinPut = 'r';
constexpr uint8_t kSetItem = 's';
constexpr uint8_t kTuple = 't';
constexpr uint8_t kEmptyTuple = ')';
constexpr uint8_t kSetItems = 'u';
constexpr uint8_t kBinFloat = 'G';
constexpr uint8_t kBinBytes = 'B';
constexpr uint8_t kShortBinBytes = 'C';
constexpr uint8_t kProto = 0x80;
constexpr uint8_t kNewObj = 0x81;
constexpr uint8_t kTuple1 = 0x85;
constexpr uint8_t kTuple2 = 0x86;
constexpr uint8_t kTuple3 = 0x87;
constexpr uint8_t kNewTrue = 0x88;
constexpr uint8_t kNewFalse = 0x89;
constexpr uint8_t kLong1 = 0x8a;
constexpr uint8_t kShortBinUnicode = 0x8c;
constexpr uint8_t kBinUnicode8 = 0x8d;
constexpr uint8_t kBinBytes8 = 0x8e;
constexpr uint8_t kEmptySet = 0x8f;
constexpr uint8_t kAddItems = 0x90;
constexpr uint8_t kFrozenSet = 0x91;
constexpr uint8_t kStackGlobal = 0x93;
constexpr uint8_t kMemoize = 0x94;
constexpr uint8_t kFrame = 0x95;

struct PyObject;
using PyRef = std::shared_ptr<PyObject>;

/**
 * @brief Value on the pickle stack
 */
struct PyObject {
  enum class Type : std::uint8_t {
    kNone,
    kBool,
    kInt,
    kFloat,
    kStr,
    kBytes,
    kList,
    kTuple,
    kDict,
    kSet,
    kGlobal,
    kDtype,
    kArray,
  };

  explicit PyObject(Type object_type) : type(object_type) {}

  Type type;
  bool bool_value = false;
  int64_t int_value = 0;
  double float_value = 0.0;
  std::string text;  ///< str, bytes, global "module.name", dtype descr
  std::vector<PyRef> items;
  std::vector<std::pair<PyRef, PyRef>> entries;
  char byteorder = '=';          ///< dtype
  std::vector<size_t> shape;     ///< ndarray
  PyRef dtype;                   ///< ndarray
  PyRef data;                    ///< ndarray (bytes or list)
};

PyRef Make(PyObject::Type type) {
  return std::make_shared<PyObject>(type);
}

PyRef MakeStr(std::string text, PyObject::Type type = PyObject::Type::kStr) {
  auto obj = Make(type);
  obj->text = std::move(text);
  return obj;
}

PyRef MakeInt(int64_t value) {
  auto obj = Make(PyObject::Type::kInt);
  obj->int_value = value;
  return obj;
}

utils::Unexpected<utils::Error> Fail(const std::string& message) {
  return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kDecodeError, "pickle: " + message));
}

bool IsText(const PyRef& obj) {
  return obj->type == PyObject::Type::kStr || obj->type == PyObject::Type::kBytes;
}

/**
 * @brief UTF-8 text to latin-1 bytes (code points above 255 are rejected)
 */
utils::Expected<std::string, utils::Error> Utf8ToLatin1(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size();) {
    auto lead = static_cast<unsigned char>(text[i]);
    if (lead < 0x80) {
      out.push_back(static_cast<char>(lead));
      ++i;
    } else if ((lead & 0xE0) == 0xC0 && i + 1 < text.size()) {
      unsigned int code = ((lead & 0x1FU) << 6) | (static_cast<unsigned char>(text[i + 1]) & 0x3FU);
      if (code > 0xFF) {
        return Fail("_codecs.encode: code point outside latin-1");
      }
      out.push_back(static_cast<char>(code));
      i += 2;
    } else {
      return Fail("_codecs.encode: code point outside latin-1");
    }
  }
  return out;
}

std::string KeyText(const PyRef& key);

nlohmann::json ToJson(const PyRef& obj);

nlohmann::json ArrayToJson(const PyObject& array) {
  // Flat element list first, then fold into nested lists by shape.
  std::vector<nlohmann::json> flat;
  if (array.data && array.data->type == PyObject::Type::kList) {
    for (const auto& item : array.data->items) {
      flat.push_back(ToJson(item));
    }
  } else if (array.data && IsText(array.data) && array.dtype) {
    std::string descr(1, array.dtype->byteorder);
    descr += array.dtype->text;
    auto dtype = ParseDtype(descr);
    if (dtype && dtype->kind != Dtype::Kind::kVoid && dtype->itemsize > 0) {
      const std::string& raw = array.data->text;
      for (size_t offset = 0; offset + dtype->itemsize <= raw.size(); offset += dtype->itemsize) {
        double value = ReadElement(raw.data() + offset, *dtype);
        if (dtype->kind == Dtype::Kind::kBool) {
          flat.emplace_back(value != 0.0);
        } else if (dtype->kind == Dtype::Kind::kFloat) {
          flat.emplace_back(value);
        } else {
          flat.emplace_back(static_cast<int64_t>(value));
        }
      }
    }
  }

  if (array.shape.empty()) {
    return flat.empty() ? nlohmann::json(nullptr) : flat.front();
  }

  // Fold innermost dimension outward.
  std::vector<nlohmann::json> level = std::move(flat);
  for (size_t d = array.shape.size(); d-- > 1;) {
    size_t width = array.shape[d];
    std::vector<nlohmann::json> folded;
    for (size_t start = 0; start + width <= level.size() && width > 0; start += width) {
      nlohmann::json group = nlohmann::json::array();
      for (size_t i = start; i < start + width; ++i) {
        group.push_back(std::move(level[i]));
      }
      folded.push_back(std::move(group));
    }
    level = std::move(folded);
  }
  nlohmann::json result = nlohmann::json::array();
  for (auto& item : level) {
    result.push_back(std::move(item));
  }
  return result;
}

nlohmann::json ToJson(const PyRef& obj) {
  switch (obj->type) {
    case PyObject::Type::kNone:
      return nullptr;
    case PyObject::Type::kBool:
      return obj->bool_value;
    case PyObject::Type::kInt:
      return obj->int_value;
    case PyObject::Type::kFloat:
      return obj->float_value;
    case PyObject::Type::kStr:
    case PyObject::Type::kBytes:
    case PyObject::Type::kGlobal:
      return obj->text;
    case PyObject::Type::kDtype:
      return std::string(1, obj->byteorder) + obj->text;
    case PyObject::Type::kList:
    case PyObject::Type::kTuple:
    case PyObject::Type::kSet: {
      nlohmann::json array = nlohmann::json::array();
      for (const auto& item : obj->items) {
        array.push_back(ToJson(item));
      }
      return array;
    }
    case PyObject::Type::kDict: {
      nlohmann::json object = nlohmann::json::object();
      for (const auto& [key, value] : obj->entries) {
        object[KeyText(key)] = ToJson(value);
      }
      return object;
    }
    case PyObject::Type::kArray:
      return ArrayToJson(*obj);
  }
  return nullptr;
}

std::string KeyText(const PyRef& key) {
  switch (key->type) {
    case PyObject::Type::kStr:
    case PyObject::Type::kBytes:
    case PyObject::Type::kGlobal:
      return key->text;
    case PyObject::Type::kTuple: {
      std::string joined;
      for (size_t i = 0; i < key->items.size(); ++i) {
        if (i > 0) {
          joined += ",";
        }
        joined += KeyText(key->items[i]);
      }
      return joined;
    }
    default:
      return ToJson(key).dump();
  }
}

/**
 * @brief Pickle virtual machine over a byte string
 */
class PickleMachine {
 public:
  explicit PickleMachine(const std::string& bytes) : bytes_(bytes) {}

  utils::Expected<PyRef, utils::Error> Run() {
    while (pos_ < bytes_.size()) {
      auto opcode = static_cast<uint8_t>(bytes_[pos_++]);
      if (opcode == kStop) {
        if (stack_.empty()) {
          return Fail("STOP with empty stack");
        }
        return stack_.back();
      }
      auto result = Execute(opcode);
      if (!result) {
        return utils::MakeUnexpected(result.error());
      }
    }
    return Fail("missing STOP opcode");
  }

 private:
  using Status = utils::Expected<void, utils::Error>;

  Status Execute(uint8_t opcode) {
    switch (opcode) {
      case kProto:
        return Skip(1);
      case kFrame:
        return Skip(8);
      case kMark:
        marks_.push_back(stack_.size());
        return {};
      case kPop:
        if (stack_.empty()) {
          return Fail("POP on empty stack");
        }
        stack_.pop_back();
        return {};
      case kPopMark:
        return PopMark().and_then([](const std::vector<PyRef>&) -> Status { return {}; });
      case kDup:
        if (stack_.empty()) {
          return Fail("DUP on empty stack");
        }
        stack_.push_back(stack_.back());
        return {};
      case kNone:
        stack_.push_back(Make(PyObject::Type::kNone));
        return {};
      case kNewTrue:
      case kNewFalse: {
        auto obj = Make(PyObject::Type::kBool);
        obj->bool_value = opcode == kNewTrue;
        stack_.push_back(obj);
        return {};
      }
      case kBinInt: {
        auto raw = ReadUnsigned(4);
        if (!raw) {
          return utils::MakeUnexpected(raw.error());
        }
        stack_.push_back(MakeInt(static_cast<int32_t>(static_cast<uint32_t>(*raw))));
        return {};
      }
      case kBinInt1:
      case kBinInt2: {
        auto raw = ReadUnsigned(opcode == kBinInt1 ? 1 : 2);
        if (!raw) {
          return utils::MakeUnexpected(raw.error());
        }
        stack_.push_back(MakeInt(static_cast<int64_t>(*raw)));
        return {};
      }
      case kLong1:
        return PushLong1();
      case kInt:
      case kLong:
        return PushTextInteger();
      case kFloat:
        return PushTextFloat();
      case kBinFloat:
        return PushBinFloat();
      case kBinUnicode:
        return PushSized(4, PyObject::Type::kStr);
      case kShortBinUnicode:
        return PushSized(1, PyObject::Type::kStr);
      case kBinUnicode8:
        return PushSized(8, PyObject::Type::kStr);
      case kBinString:
        return PushSized(4, PyObject::Type::kStr);
      case kShortBinString:
        return PushSized(1, PyObject::Type::kStr);
      case kBinBytes:
        return PushSized(4, PyObject::Type::kBytes);
      case kShortBinBytes:
        return PushSized(1, PyObject::Type::kBytes);
      case kBinBytes8:
        return PushSized(8, PyObject::Type::kBytes);
      case kEmptyDict:
        stack_.push_back(Make(PyObject::Type::kDict));
        return {};
      case kEmptyList:
        stack_.push_back(Make(PyObject::Type::kList));
        return {};
      case kEmptyTuple:
        stack_.push_back(Make(PyObject::Type::kTuple));
        return {};
      case kEmptySet:
        stack_.push_back(Make(PyObject::Type::kSet));
        return {};
      case kTuple:
      case kList:
      case kFrozenSet: {
        auto items = PopMark();
        if (!items) {
          return utils::MakeUnexpected(items.error());
        }
        PyObject::Type type = PyObject::Type::kTuple;
        if (opcode == kList) {
          type = PyObject::Type::kList;
        } else if (opcode == kFrozenSet) {
          type = PyObject::Type::kSet;
        }
        auto obj = Make(type);
        obj->items = std::move(*items);
        stack_.push_back(obj);
        return {};
      }
      case kTuple1:
      case kTuple2:
      case kTuple3:
        return PushSmallTuple(static_cast<size_t>(opcode - kTuple1 + 1));
      case kDict: {
        auto items = PopMark();
        if (!items) {
          return utils::MakeUnexpected(items.error());
        }
        if (items->size() % 2 != 0) {
          return Fail("DICT with odd number of items");
        }
        auto obj = Make(PyObject::Type::kDict);
        for (size_t i = 0; i < items->size(); i += 2) {
          obj->entries.emplace_back((*items)[i], (*items)[i + 1]);
        }
        stack_.push_back(obj);
        return {};
      }
      case kAppend:
        return Append();
      case kAppends:
      case kAddItems:
        return Appends();
      case kSetItem:
        return SetItem();
      case kSetItems:
        return SetItems();
      case kBinPut:
      case kLongBinPut: {
        auto index = ReadUnsigned(opcode == kBinPut ? 1 : 4);
        if (!index) {
          return utils::MakeUnexpected(index.error());
        }
        return Memoize(static_cast<uint32_t>(*index));
      }
      case kMemoize:
        return Memoize(static_cast<uint32_t>(memo_.size()));
      case kBinGet:
      case kLongBinGet: {
        auto index = ReadUnsigned(opcode == kBinGet ? 1 : 4);
        if (!index) {
          return utils::MakeUnexpected(index.error());
        }
        return MemoGet(static_cast<uint32_t>(*index));
      }
      case kPut:
      case kGet: {
        auto line = ReadLine();
        if (!line) {
          return utils::MakeUnexpected(line.error());
        }
        uint32_t index = 0;
        try {
          index = static_cast<uint32_t>(std::stoul(*line));
        } catch (const std::exception&) {
          return Fail("malformed memo index '" + *line + "'");
        }
        return opcode == kPut ? Memoize(index) : MemoGet(index);
      }
      case kGlobal: {
        auto module = ReadLine();
        if (!module) {
          return utils::MakeUnexpected(module.error());
        }
        auto name = ReadLine();
        if (!name) {
          return utils::MakeUnexpected(name.error());
        }
        return PushGlobal(*module, *name);
      }
      case kStackGlobal: {
        if (stack_.size() < 2) {
          return Fail("STACK_GLOBAL needs two strings");
        }
        PyRef name = stack_.back();
        stack_.pop_back();
        PyRef module = stack_.back();
        stack_.pop_back();
        if (!IsText(module) || !IsText(name)) {
          return Fail("STACK_GLOBAL operands are not strings");
        }
        return PushGlobal(module->text, name->text);
      }
      case kReduce:
        return Reduce();
      case kNewObj:
        return Reduce();
      case kBuild:
        return Build();
      default:
        break;
    }
    char hex[8];
    std::snprintf(hex, sizeof(hex), "0x%02x", opcode);
    return Fail(std::string("unsupported opcode ") + hex + " at offset " + std::to_string(pos_ - 1));
  }

  Status Skip(size_t count) {
    if (pos_ + count > bytes_.size()) {
      return Fail("truncated data");
    }
    pos_ += count;
    return {};
  }

  utils::Expected<uint64_t, utils::Error> ReadUnsigned(size_t width) {
    if (pos_ + width > bytes_.size()) {
      return Fail("truncated data");
    }
    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i) {
      value |= static_cast<uint64_t>(static_cast<unsigned char>(bytes_[pos_ + i])) << (8 * i);
    }
    pos_ += width;
    return value;
  }

  utils::Expected<std::string, utils::Error> ReadLine() {
    size_t end = bytes_.find('\n', pos_);
    if (end == std::string::npos) {
      return Fail("unterminated line");
    }
    std::string line = bytes_.substr(pos_, end - pos_);
    pos_ = end + 1;
    return line;
  }

  utils::Expected<std::vector<PyRef>, utils::Error> PopMark() {
    if (marks_.empty()) {
      return Fail("no MARK on stack");
    }
    size_t mark = marks_.back();
    marks_.pop_back();
    if (mark > stack_.size()) {
      return Fail("corrupt MARK");
    }
    std::vector<PyRef> items(stack_.begin() + static_cast<std::ptrdiff_t>(mark), stack_.end());
    stack_.resize(mark);
    return items;
  }

  Status PushSized(size_t len_width, PyObject::Type type) {
    auto len = ReadUnsigned(len_width);
    if (!len) {
      return utils::MakeUnexpected(len.error());
    }
    if (pos_ + *len > bytes_.size()) {
      return Fail("truncated string");
    }
    stack_.push_back(MakeStr(bytes_.substr(pos_, static_cast<size_t>(*len)), type));
    pos_ += static_cast<size_t>(*len);
    return {};
  }

  Status PushLong1() {
    auto len = ReadUnsigned(1);
    if (!len) {
      return utils::MakeUnexpected(len.error());
    }
    if (*len > 8) {
      return Fail("integer wider than 64 bits");
    }
    auto raw = ReadUnsigned(static_cast<size_t>(*len));
    if (!raw) {
      return utils::MakeUnexpected(raw.error());
    }
    uint64_t value = *raw;
    if (*len > 0 && *len < 8 && (value & (uint64_t{1} << (*len * 8 - 1))) != 0) {
      value |= ~uint64_t{0} << (*len * 8);
    }
    stack_.push_back(MakeInt(static_cast<int64_t>(value)));
    return {};
  }

  Status PushTextInteger() {
    auto line = ReadLine();
    if (!line) {
      return utils::MakeUnexpected(line.error());
    }
    std::string text = *line;
    if (!text.empty() && text.back() == 'L') {
      text.pop_back();
    }
    if (text == "01" || text == "00") {
      auto obj = Make(PyObject::Type::kBool);
      obj->bool_value = text == "01";
      stack_.push_back(obj);
      return {};
    }
    try {
      stack_.push_back(MakeInt(std::stoll(text)));
    } catch (const std::exception&) {
      return Fail("malformed integer '" + text + "'");
    }
    return {};
  }

  Status PushTextFloat() {
    auto line = ReadLine();
    if (!line) {
      return utils::MakeUnexpected(line.error());
    }
    auto obj = Make(PyObject::Type::kFloat);
    try {
      obj->float_value = std::stod(*line);
    } catch (const std::exception&) {
      return Fail("malformed float '" + *line + "'");
    }
    stack_.push_back(obj);
    return {};
  }

  Status PushBinFloat() {
    if (pos_ + 8 > bytes_.size()) {
      return Fail("truncated float");
    }
    Dtype big_endian_f8;
    big_endian_f8.kind = Dtype::Kind::kFloat;
    big_endian_f8.itemsize = 8;
    big_endian_f8.little_endian = false;
    auto obj = Make(PyObject::Type::kFloat);
    obj->float_value = ReadElement(bytes_.data() + pos_, big_endian_f8);
    pos_ += 8;
    stack_.push_back(obj);
    return {};
  }

  Status PushSmallTuple(size_t count) {
    if (stack_.size() < count) {
      return Fail("TUPLE" + std::to_string(count) + " on short stack");
    }
    auto obj = Make(PyObject::Type::kTuple);
    obj->items.assign(stack_.end() - static_cast<std::ptrdiff_t>(count), stack_.end());
    stack_.resize(stack_.size() - count);
    stack_.push_back(obj);
    return {};
  }

  Status Append() {
    if (stack_.size() < 2) {
      return Fail("APPEND on short stack");
    }
    PyRef value = stack_.back();
    stack_.pop_back();
    PyRef& target = stack_.back();
    if (target->type != PyObject::Type::kList) {
      return Fail("APPEND target is not a list");
    }
    target->items.push_back(value);
    return {};
  }

  Status Appends() {
    auto items = PopMark();
    if (!items) {
      return utils::MakeUnexpected(items.error());
    }
    if (stack_.empty()) {
      return Fail("APPENDS without target");
    }
    PyRef& target = stack_.back();
    if (target->type != PyObject::Type::kList && target->type != PyObject::Type::kSet) {
      return Fail("APPENDS target is not a list or set");
    }
    target->items.insert(target->items.end(), items->begin(), items->end());
    return {};
  }

  Status SetItem() {
    if (stack_.size() < 3) {
      return Fail("SETITEM on short stack");
    }
    PyRef value = stack_.back();
    stack_.pop_back();
    PyRef key = stack_.back();
    stack_.pop_back();
    PyRef& target = stack_.back();
    if (target->type != PyObject::Type::kDict) {
      return Fail("SETITEM target is not a dict");
    }
    target->entries.emplace_back(key, value);
    return {};
  }

  Status SetItems() {
    auto items = PopMark();
    if (!items) {
      return utils::MakeUnexpected(items.error());
    }
    if (stack_.empty() || stack_.back()->type != PyObject::Type::kDict) {
      return Fail("SETITEMS target is not a dict");
    }
    if (items->size() % 2 != 0) {
      return Fail("SETITEMS with odd number of items");
    }
    PyRef& target = stack_.back();
    for (size_t i = 0; i < items->size(); i += 2) {
      target->entries.emplace_back((*items)[i], (*items)[i + 1]);
    }
    return {};
  }

  Status Memoize(uint32_t index) {
    if (stack_.empty()) {
      return Fail("memoize on empty stack");
    }
    memo_[index] = stack_.back();
    return {};
  }

  Status MemoGet(uint32_t index) {
    auto iter = memo_.find(index);
    if (iter == memo_.end()) {
      return Fail("memo key " + std::to_string(index) + " not found");
    }
    stack_.push_back(iter->second);
    return {};
  }

  Status PushGlobal(const std::string& module, const std::string& name) {
    static const char* const kAllowed[] = {
        "builtins.set",
        "builtins.frozenset",
        "__builtin__.set",
        "__builtin__.frozenset",
        "collections.OrderedDict",
        "numpy.dtype",
        "numpy.ndarray",
        "numpy.core.multiarray._reconstruct",
        "numpy.core.multiarray.scalar",
        "numpy._core.multiarray._reconstruct",
        "numpy._core.multiarray.scalar",
        "_codecs.encode",
    };
    std::string qualified = module + "." + name;
    for (const char* allowed : kAllowed) {
      if (qualified == allowed) {
        stack_.push_back(MakeStr(qualified, PyObject::Type::kGlobal));
        return {};
      }
    }
    return Fail("global '" + qualified + "' is not allowed");
  }

  static bool EndsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
  }

  Status Reduce() {
    if (stack_.size() < 2) {
      return Fail("REDUCE on short stack");
    }
    PyRef args = stack_.back();
    stack_.pop_back();
    PyRef callable = stack_.back();
    stack_.pop_back();
    if (callable->type != PyObject::Type::kGlobal || args->type != PyObject::Type::kTuple) {
      return Fail("REDUCE expects a global and an argument tuple");
    }
    const std::string& name = callable->text;
    const auto& argv = args->items;

    if (EndsWith(name, ".set") || EndsWith(name, ".frozenset")) {
      auto obj = Make(PyObject::Type::kSet);
      if (!argv.empty()) {
        obj->items = argv[0]->items;
      }
      stack_.push_back(obj);
      return {};
    }
    if (name == "collections.OrderedDict") {
      auto obj = Make(PyObject::Type::kDict);
      if (!argv.empty()) {
        for (const auto& pair : argv[0]->items) {
          if (pair->items.size() == 2) {
            obj->entries.emplace_back(pair->items[0], pair->items[1]);
          }
        }
      }
      stack_.push_back(obj);
      return {};
    }
    if (name == "numpy.dtype") {
      if (argv.empty() || !IsText(argv[0])) {
        return Fail("numpy.dtype expects a type string");
      }
      auto obj = Make(PyObject::Type::kDtype);
      obj->text = argv[0]->text;
      stack_.push_back(obj);
      return {};
    }
    if (EndsWith(name, "._reconstruct")) {
      stack_.push_back(Make(PyObject::Type::kArray));
      return {};
    }
    if (EndsWith(name, ".scalar")) {
      if (argv.size() < 2 || argv[0]->type != PyObject::Type::kDtype || !IsText(argv[1])) {
        return Fail("numpy scalar expects (dtype, bytes)");
      }
      auto array = Make(PyObject::Type::kArray);
      array->dtype = argv[0];
      array->data = argv[1];
      nlohmann::json value = ArrayToJson(*array);
      PyRef obj;
      if (value.is_boolean()) {
        obj = Make(PyObject::Type::kBool);
        obj->bool_value = value.get<bool>();
      } else if (value.is_number_integer()) {
        obj = MakeInt(value.get<int64_t>());
      } else if (value.is_number()) {
        obj = Make(PyObject::Type::kFloat);
        obj->float_value = value.get<double>();
      } else {
        return Fail("numpy scalar of unsupported dtype '" + argv[0]->text + "'");
      }
      stack_.push_back(obj);
      return {};
    }
    if (name == "_codecs.encode") {
      if (argv.empty() || !IsText(argv[0])) {
        return Fail("_codecs.encode expects a string");
      }
      auto bytes = Utf8ToLatin1(argv[0]->text);
      if (!bytes) {
        return utils::MakeUnexpected(bytes.error());
      }
      stack_.push_back(MakeStr(std::move(*bytes), PyObject::Type::kBytes));
      return {};
    }
    return Fail("cannot call '" + name + "'");
  }

  Status Build() {
    if (stack_.size() < 2) {
      return Fail("BUILD on short stack");
    }
    PyRef state = stack_.back();
    stack_.pop_back();
    PyRef& target = stack_.back();

    switch (target->type) {
      case PyObject::Type::kDtype:
        // (version, byteorder, subarray, names, fields, elsize, alignment, flags)
        if (state->type == PyObject::Type::kTuple && state->items.size() >= 2 && IsText(state->items[1]) &&
            !state->items[1]->text.empty()) {
          target->byteorder = state->items[1]->text[0];
        }
        return {};
      case PyObject::Type::kArray: {
        // (version, shape, dtype, is_fortran, data)
        if (state->type != PyObject::Type::kTuple || state->items.size() < 5) {
          return Fail("malformed ndarray state");
        }
        const auto& shape = state->items[1];
        for (const auto& dim : shape->items) {
          if (dim->type != PyObject::Type::kInt || dim->int_value < 0) {
            return Fail("malformed ndarray shape");
          }
          target->shape.push_back(static_cast<size_t>(dim->int_value));
        }
        if (state->items[3]->type == PyObject::Type::kBool && state->items[3]->bool_value && target->shape.size() > 1) {
          return Fail("fortran-ordered arrays are not supported");
        }
        target->dtype = state->items[2];
        target->data = state->items[4];
        return {};
      }
      case PyObject::Type::kDict:
        if (state->type == PyObject::Type::kDict) {
          target->entries.insert(target->entries.end(), state->entries.begin(), state->entries.end());
        }
        return {};
      default:
        break;
    }
    return Fail("BUILD on unsupported object");
  }

  const std::string& bytes_;
  size_t pos_ = 0;
  std::vector<PyRef> stack_;
  std::vector<size_t> marks_;
  std::unordered_map<uint32_t, PyRef> memo_;
};

}  // namespace

utils::Expected<nlohmann::json, utils::Error> DecodePickle(const std::string& bytes) {
  if (bytes.empty()) {
    return Fail("empty input");
  }
  PickleMachine machine(bytes);
  auto root = machine.Run();
  if (!root) {
    return utils::MakeUnexpected(root.error());
  }
  return ToJson(*root);
}

}  // namespace casereader::codec
