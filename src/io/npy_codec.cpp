#include "io/npy_codec.hpp"

#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include "common/array.hpp"
#include "common/errors.hpp"
#include "mpi/collectives.hpp"

namespace fs = std::filesystem;

namespace shardcat {

    using nlohmann::json;

    static const char kMagic[] = "\x93NUMPY";
    static const size_t kMagicLen = 6;
    static const size_t kAlign = 64;

    // ============================ Python literal parser ============================

    namespace {

        class PyLiteralParser {
        public:
            explicit PyLiteralParser(const std::string& s) : s_(s) {}

            json parse() {
                json v = value();
                skip_ws();
                if (pos_ != s_.size()) fail("trailing characters");
                return v;
            }

        private:
            [[noreturn]] void fail(const std::string& what) const {
                throw Corrupt("Malformed npy header (" + what + " at offset " + std::to_string(pos_) + ")");
            }

            void skip_ws() {
                while (pos_ < s_.size() && std::isspace((unsigned char)s_[pos_])) ++pos_;
            }

            bool consume(char c) {
                skip_ws();
                if (pos_ < s_.size() && s_[pos_] == c) { ++pos_; return true; }
                return false;
            }

            json value() {
                skip_ws();
                if (pos_ >= s_.size()) fail("unexpected end");
                const char c = s_[pos_];
                if (c == '{') return dict();
                if (c == '[') return sequence('[', ']');
                if (c == '(') return sequence('(', ')');
                if (c == '\'' || c == '"') return string();
                if (c == '-' || c == '+' || std::isdigit((unsigned char)c)) return number();
                if (std::isalpha((unsigned char)c)) return keyword();
                fail(std::string("unexpected '") + c + "'");
            }

            json dict() {
                ++pos_;
                json out = json::object();
                while (!consume('}')) {
                    json key = value();
                    if (!key.is_string()) fail("non-string key");
                    if (!consume(':')) fail("expected ':'");
                    out[key.get<std::string>()] = value();
                    if (!consume(',')) {
                        if (!consume('}')) fail("expected ',' or '}'");
                        break;
                    }
                }
                return out;
            }

            json sequence(char open, char close) {
                if (s_[pos_] != open) fail(std::string("expected '") + open + "'");
                ++pos_;
                json out = json::array();
                while (!consume(close)) {
                    out.push_back(value());
                    if (!consume(',')) {
                        if (!consume(close)) fail(std::string("expected ',' or '") + close + "'");
                        break;
                    }
                }
                return out;
            }

            json string() {
                const char quote = s_[pos_++];
                std::string out;
                while (pos_ < s_.size() && s_[pos_] != quote) {
                    if (s_[pos_] == '\\' && pos_ + 1 < s_.size()) ++pos_;
                    out += s_[pos_++];
                }
                if (pos_ >= s_.size()) fail("unterminated string");
                ++pos_;
                return out;
            }

            json number() {
                const size_t begin = pos_;
                if (s_[pos_] == '-' || s_[pos_] == '+') ++pos_;
                while (pos_ < s_.size() && std::isdigit((unsigned char)s_[pos_])) ++pos_;
                // a trailing 'L' appears in headers written by Python 2
                const std::string digits = s_.substr(begin, pos_ - begin);
                if (pos_ < s_.size() && s_[pos_] == 'L') ++pos_;
                try {
                    return json(std::stoll(digits));
                }
                catch (const std::exception&) {
                    fail("bad integer '" + digits + "'");
                }
            }

            json keyword() {
                const size_t begin = pos_;
                while (pos_ < s_.size() && std::isalnum((unsigned char)s_[pos_])) ++pos_;
                const std::string word = s_.substr(begin, pos_ - begin);
                if (word == "True") return true;
                if (word == "False") return false;
                if (word == "None") return nullptr;
                fail("unknown name '" + word + "'");
            }

            const std::string& s_;
            size_t pos_ = 0;
        };

        uint32_t read_le(const unsigned char* p, size_t n) {
            uint32_t v = 0;
            for (size_t i = 0; i < n; ++i) v |= (uint32_t)p[i] << (8 * i);
            return v;
        }

        std::vector<int64_t> shape_from_json(const json& j, const std::string& where) {
            std::vector<int64_t> out;
            if (j.is_number_integer()) {
                out.push_back(j.get<int64_t>());
                return out;
            }
            if (!j.is_array()) throw UnsupportedLayout(where + ": bad field shape " + j.dump());
            for (const auto& d : j) {
                if (!d.is_number_integer() || d.get<int64_t>() < 0)
                    throw UnsupportedLayout(where + ": bad field shape " + j.dump());
                out.push_back(d.get<int64_t>());
            }
            return out;
        }

        // Field layout from a structured 'descr'. Unnamed void fields are padding.
        std::vector<RecordField> fields_from_descr(const json& descr, int64_t& itemsize, const std::string& path) {
            if (!descr.is_array())
                throw UnsupportedLayout(path + " is not a structured array (descr " + descr.dump() + ")");

            std::vector<RecordField> fields;
            itemsize = 0;
            for (const auto& entry : descr) {
                if (!entry.is_array() || entry.size() < 2 || !entry[0].is_string() || !entry[1].is_string()
                    || entry[1].get<std::string>().empty())
                    throw UnsupportedLayout(path + ": unsupported field description " + entry.dump());

                const std::string name = entry[0].get<std::string>();
                const std::string type = entry[1].get<std::string>();
                std::vector<int64_t> itemshape;
                if (entry.size() > 2) itemshape = shape_from_json(entry[2], path);
                int64_t count = 1;
                for (auto d : itemshape) count *= d;

                if (type.size() >= 2 && type[1] == 'V') {
                    if (!name.empty()) throw UnsupportedLayout(path + ": void field " + name + " is not supported");
                    int64_t pad = 0;
                    try {
                        size_t used = 0;
                        pad = std::stoll(type.substr(2), &used);
                        if (used != type.size() - 2) pad = -1;
                    }
                    catch (const std::exception&) {
                        pad = -1;
                    }
                    if (pad <= 0) throw Corrupt(path + ": bad padding field type " + type);
                    itemsize += pad * count;
                    continue;
                }
                if (type[0] == '>')
                    throw UnsupportedLayout(path + ": big-endian field " + name + " (" + type + ") is not supported");

                RecordField f;
                f.name = name;
                try {
                    f.dtype = dtype_from_str(type);
                }
                catch (const std::runtime_error&) {
                    throw UnsupportedLayout(path + ": field " + name + " has unsupported type " + type);
                }
                f.itemshape = itemshape;
                f.offset = itemsize;
                itemsize += (int64_t)dtype_size(f.dtype) * count;
                fields.push_back(std::move(f));
            }
            return fields;
        }

    } // namespace

    json parse_py_literal(const std::string& text) {
        return PyLiteralParser(text).parse();
    }

    // ============================ header ============================

    NpyHeader read_npy_header(const std::string& path) {
        if (!fs::exists(path)) throw NotFound("File not found: " + path);
        std::ifstream in(path, std::ios::binary);
        if (!in) throw NotFound("Cannot open " + path);

        unsigned char pre[12];
        in.read(reinterpret_cast<char*>(pre), 10);
        if (in.gcount() != 10 || std::memcmp(pre, kMagic, kMagicLen) != 0)
            throw Corrupt(path + " is not a .npy file");

        NpyHeader h;
        h.major = pre[6];
        h.minor = pre[7];
        size_t len_bytes = 2;
        if (h.major == 1) len_bytes = 2;
        else if (h.major == 2 || h.major == 3) len_bytes = 4;
        else throw UnsupportedLayout(path + ": npy format version " + std::to_string(h.major) + " is not supported");

        if (len_bytes == 4) {
            in.read(reinterpret_cast<char*>(pre + 10), 2);
            if (in.gcount() != 2) throw Corrupt(path + ": truncated header");
        }
        const uint32_t hlen = read_le(pre + 8, len_bytes);
        std::string text(hlen, '\0');
        in.read(&text[0], hlen);
        if ((uint32_t)in.gcount() != hlen) throw Corrupt(path + ": truncated header");
        h.data_offset = (int64_t)(8 + len_bytes + hlen);

        const json dict = parse_py_literal(text);
        if (!dict.is_object() || !dict.contains("descr") || !dict.contains("shape"))
            throw Corrupt(path + ": header lacks 'descr' or 'shape'");
        if (dict.value("fortran_order", false))
            throw UnsupportedLayout(path + ": Fortran-ordered arrays are not supported");

        h.fields = fields_from_descr(dict.at("descr"), h.itemsize, path);
        const std::vector<int64_t> shape = shape_from_json(dict.at("shape"), path);
        if (shape.size() != 1)
            throw UnsupportedLayout(path + ": expected a one-dimensional record array, got shape " + shape_str(shape));
        h.rows = shape[0];

        std::error_code ec;
        const auto fsize = fs::file_size(path, ec);
        if (ec) throw Corrupt("Cannot stat " + path + ": " + ec.message());
        if ((int64_t)fsize < h.data_offset + h.rows * h.itemsize) {
            throw Corrupt(path + " is truncated: " + std::to_string(h.rows) + " records of "
                + std::to_string(h.itemsize) + " bytes need " + std::to_string(h.data_offset + h.rows * h.itemsize)
                + " bytes, file has " + std::to_string(fsize));
        }
        return h;
    }

    std::string npy_header_dict(const std::vector<RecordField>& fields, int64_t rows) {
        std::ostringstream os;
        os << "{'descr': [";
        for (size_t i = 0; i < fields.size(); ++i) {
            const RecordField& f = fields[i];
            if (i) os << ", ";
            os << "('" << f.name << "', '" << dtype_str(f.dtype) << "'";
            if (!f.itemshape.empty()) os << ", " << shape_str(f.itemshape);
            os << ")";
        }
        os << "], 'fortran_order': False, 'shape': (" << rows << ",), }";
        return os.str();
    }

    // ============================ codec ============================

    FileHeader NpyCodec::read_header(const std::string& path) const {
        const NpyHeader nh = read_npy_header(path);
        FileHeader h;
        h.size = nh.rows;
        for (const auto& f : nh.fields) h.columns.push_back(f.name);
        return h;
    }

    Array NpyCodec::read_slice(const std::string& path, const std::string& column, RowRange rows) const {
        const NpyHeader nh = read_npy_header(path);
        const RecordField* field = nullptr;
        for (const auto& f : nh.fields) if (f.name == column) field = &f;
        if (!field) throw ColumnNotFound("Column " + column + " not found in " + path);
        if (rows.begin < 0 || rows.end > nh.rows || rows.begin > rows.end) {
            throw Corrupt("Rows [" + std::to_string(rows.begin) + ", " + std::to_string(rows.end)
                + ") out of range for " + path + " (" + std::to_string(nh.rows) + " records)");
        }

        RecordArray rec;
        rec.fields = nh.fields;
        rec.itemsize = nh.itemsize;
        rec.n_rows = rows.size();
        rec.bytes.resize((size_t)(rec.n_rows * rec.itemsize));
        if (!rec.bytes.empty()) {
            std::ifstream in(path, std::ios::binary);
            in.seekg(nh.data_offset + rows.begin * nh.itemsize);
            in.read(reinterpret_cast<char*>(rec.bytes.data()), (std::streamsize)rec.bytes.size());
            if (!in || (size_t)in.gcount() != rec.bytes.size())
                throw Corrupt("Short read of " + column + " from " + path);
        }
        return extract_field(rec, column);
    }

    void NpyCodec::write_slice(MPI_Comm comm, const std::string& path, const SliceData& data,
        const json& attrs) const {
        (void)attrs;
        const RecordArray* rec = std::get_if<RecordArray>(&data);
        if (!rec) throw std::runtime_error("npy codec expects record packing");

        // records travel as raw rows of 'itemsize' bytes
        Array raw = make_array(DType::UInt8, get_shape(rec->n_rows, { rec->itemsize }));
        raw.bytes = rec->bytes;
        const int root = 0;
        Array all = gather_array(comm, raw, root);

        run_on_root(comm, root, [&]() {
            const int64_t rows = all.n_rows();
            std::string dict = npy_header_dict(rec->fields, rows);

            // pad with spaces so the data starts on a 64-byte boundary, newline last
            // (format 2.0 once the header no longer fits a 16-bit length)
            size_t len_bytes = 2;
            int major = 1;
            if (dict.size() + 1 + kAlign > 65535) {
                major = 2;
                len_bytes = 4;
            }
            const size_t total = kMagicLen + 2 + len_bytes + dict.size() + 1;
            const size_t pad = (kAlign - total % kAlign) % kAlign;
            dict.append(pad, ' ');
            dict.push_back('\n');
            const uint32_t hlen = (uint32_t)dict.size();

            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            if (!out) throw IOFailure("Cannot create " + path);
            out.write(kMagic, (std::streamsize)kMagicLen);
            out.put((char)major);
            out.put(0);
            for (size_t i = 0; i < len_bytes; ++i) out.put((char)((hlen >> (8 * i)) & 0xff));
            out.write(dict.data(), (std::streamsize)dict.size());
            if (!all.bytes.empty()) out.write(reinterpret_cast<const char*>(all.bytes.data()), (std::streamsize)all.bytes.size());
            out.flush();
            if (!out) throw IOFailure("Failed writing " + path);
            });
    }

} // namespace shardcat
