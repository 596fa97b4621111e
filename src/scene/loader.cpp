/// @file loader.cpp
/// @brief glTF document loading, cross-reference linking and writing

#include <keyfix/scene/loader.hpp>
#include <keyfix/core/log.hpp>

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>

namespace keyfix_scene {

namespace fs = std::filesystem;
using keyfix_core::Error;
using keyfix_core::FormatError;
using keyfix_core::IoError;

// =============================================================================
// JSON Field Helpers
// =============================================================================

namespace {

/// Reads typed fields from one JSON object, keeping the first type error
class FieldReader {
public:
    FieldReader(const nlohmann::json& obj, std::string where)
        : m_obj(obj), m_where(std::move(where)) {}

    [[nodiscard]] const std::optional<Error>& error() const { return m_error; }

    std::optional<std::int64_t> index(const char* key) {
        if (!m_obj.contains(key)) {
            return std::nullopt;
        }
        const auto& v = m_obj[key];
        if (!v.is_number_integer()) {
            fail(key, "expected an integer index");
            return std::nullopt;
        }
        return v.get<std::int64_t>();
    }

    std::uint64_t unsigned_or(const char* key, std::uint64_t fallback) {
        if (!m_obj.contains(key)) {
            return fallback;
        }
        const auto& v = m_obj[key];
        if (!v.is_number_integer() || (!v.is_number_unsigned() && v.get<std::int64_t>() < 0)) {
            fail(key, "expected a non-negative integer");
            return fallback;
        }
        return v.get<std::uint64_t>();
    }

    std::string string_or(const char* key, std::string fallback) {
        if (!m_obj.contains(key)) {
            return fallback;
        }
        const auto& v = m_obj[key];
        if (!v.is_string()) {
            fail(key, "expected a string");
            return fallback;
        }
        return v.get<std::string>();
    }

    bool bool_or(const char* key, bool fallback) {
        if (!m_obj.contains(key)) {
            return fallback;
        }
        const auto& v = m_obj[key];
        if (!v.is_boolean()) {
            fail(key, "expected a boolean");
            return fallback;
        }
        return v.get<bool>();
    }

    /// Numeric array; non-numeric entries (e.g. a NaN dumped as null) read as NaN
    std::vector<double> numbers(const char* key) {
        std::vector<double> out;
        if (!m_obj.contains(key)) {
            return out;
        }
        const auto& v = m_obj[key];
        if (!v.is_array()) {
            fail(key, "expected an array of numbers");
            return out;
        }
        out.reserve(v.size());
        for (const auto& item : v) {
            out.push_back(item.is_number() ? item.get<double>() : std::numeric_limits<double>::quiet_NaN());
        }
        return out;
    }

    /// Nested array; absent reads as empty
    const nlohmann::json* array(const char* key) {
        if (!m_obj.contains(key)) {
            return nullptr;
        }
        const auto& v = m_obj[key];
        if (!v.is_array()) {
            fail(key, "expected an array");
            return nullptr;
        }
        return &v;
    }

private:
    void fail(const char* key, const char* reason) {
        if (!m_error) {
            m_error = Error(FormatError::invalid_field(m_where + "." + key, reason));
        }
    }

    const nlohmann::json& m_obj;
    std::string m_where;
    std::optional<Error> m_error;
};

std::string where(const char* section, std::size_t index) {
    return std::string(section) + "[" + std::to_string(index) + "]";
}

/// Root must be an object holding accessors, bufferViews and buffers arrays
keyfix_core::Result<void> check_layout(const nlohmann::json& doc, const fs::path& source) {
    if (!doc.is_object()) {
        return Error(FormatError::not_an_object(source.string()));
    }
    for (const char* section : {"accessors", "bufferViews", "buffers"}) {
        if (!doc.contains(section)) {
            return Error(FormatError::missing_section(section));
        }
        if (!doc[section].is_array()) {
            return Error(FormatError::invalid_field(section, "expected an array"));
        }
    }
    const auto& buffers = doc["buffers"];
    if (buffers.size() != 1) {
        return Error(FormatError::unsupported_buffer(
            "expected exactly one buffer, found " + std::to_string(buffers.size())));
    }
    if (!buffers[0].is_object()) {
        return Error(FormatError::invalid_field("buffers[0]", "expected an object"));
    }
    return keyfix_core::Ok();
}

keyfix_core::Result<Buffer> parse_buffer(const nlohmann::json& j, std::size_t i) {
    FieldReader r(j, where("buffers", i));
    Buffer buffer;
    buffer.name = r.string_or("name", "");
    buffer.uri = r.string_or("uri", "");
    buffer.declared_length = r.unsigned_or("byteLength", 0);
    if (r.error()) {
        return keyfix_core::Err<Buffer>(*r.error());
    }
    return keyfix_core::Ok(std::move(buffer));
}

keyfix_core::Result<BufferView> parse_buffer_view(const nlohmann::json& j, std::size_t i) {
    if (!j.is_object()) {
        return keyfix_core::Err<BufferView>(FormatError::invalid_field(where("bufferViews", i), "expected an object"));
    }
    FieldReader r(j, where("bufferViews", i));
    BufferView view;
    view.name = r.string_or("name", "");
    view.buffer = r.index("buffer").value_or(-1);
    view.byte_offset = r.unsigned_or("byteOffset", 0);
    view.byte_length = r.unsigned_or("byteLength", 0);
    if (j.contains("byteStride")) {
        std::uint64_t stride = r.unsigned_or("byteStride", 0);
        if (stride > kMaxByteStride) {
            return keyfix_core::Err<BufferView>(FormatError::invalid_field(
                where("bufferViews", i) + ".byteStride",
                "stride " + std::to_string(stride) + " exceeds " + std::to_string(kMaxByteStride)));
        }
        view.byte_stride = static_cast<std::uint32_t>(stride);
    }
    if (r.error()) {
        return keyfix_core::Err<BufferView>(*r.error());
    }
    return keyfix_core::Ok(std::move(view));
}

keyfix_core::Result<Accessor> parse_accessor(const nlohmann::json& j, std::size_t i) {
    if (!j.is_object()) {
        return keyfix_core::Err<Accessor>(FormatError::invalid_field(where("accessors", i), "expected an object"));
    }
    FieldReader r(j, where("accessors", i));
    Accessor accessor;
    accessor.name = r.string_or("name", "");
    accessor.buffer_view = r.index("bufferView");
    accessor.byte_offset = r.unsigned_or("byteOffset", 0);
    accessor.component_type = static_cast<std::uint32_t>(r.unsigned_or("componentType", 0));
    accessor.count = r.unsigned_or("count", 0);
    accessor.type = r.string_or("type", "");
    accessor.normalized = r.bool_or("normalized", false);
    accessor.min = r.numbers("min");
    accessor.max = r.numbers("max");
    if (r.error()) {
        return keyfix_core::Err<Accessor>(*r.error());
    }
    return keyfix_core::Ok(std::move(accessor));
}

keyfix_core::Result<Animation> parse_animation(const nlohmann::json& j, std::size_t i) {
    if (!j.is_object()) {
        return keyfix_core::Err<Animation>(FormatError::invalid_field(where("animations", i), "expected an object"));
    }
    FieldReader r(j, where("animations", i));
    Animation anim;
    anim.name = r.string_or("name", "");

    if (const auto* samplers = r.array("samplers")) {
        for (std::size_t s = 0; s < samplers->size(); ++s) {
            const auto& sj = (*samplers)[s];
            if (!sj.is_object()) {
                return keyfix_core::Err<Animation>(
                    FormatError::invalid_field(where("animations", i) + where(".samplers", s), "expected an object"));
            }
            FieldReader sr(sj, where("animations", i) + where(".samplers", s));
            AnimationSampler sampler;
            sampler.input = sr.index("input").value_or(-1);
            sampler.output = sr.index("output").value_or(-1);
            sampler.interpolation = sr.string_or("interpolation", "LINEAR");
            if (sr.error()) {
                return keyfix_core::Err<Animation>(*sr.error());
            }
            anim.samplers.push_back(std::move(sampler));
        }
    }

    if (const auto* channels = r.array("channels")) {
        for (std::size_t c = 0; c < channels->size(); ++c) {
            const auto& cj = (*channels)[c];
            if (!cj.is_object()) {
                return keyfix_core::Err<Animation>(
                    FormatError::invalid_field(where("animations", i) + where(".channels", c), "expected an object"));
            }
            FieldReader cr(cj, where("animations", i) + where(".channels", c));
            AnimationChannel channel;
            channel.sampler = cr.index("sampler").value_or(-1);
            if (cj.contains("target") && cj["target"].is_object()) {
                FieldReader tr(cj["target"], where("animations", i) + where(".channels", c) + ".target");
                channel.node = tr.index("node");
                channel.path = tr.string_or("path", "");
                if (tr.error()) {
                    return keyfix_core::Err<Animation>(*tr.error());
                }
            }
            if (cr.error()) {
                return keyfix_core::Err<Animation>(*cr.error());
            }
            anim.channels.push_back(std::move(channel));
        }
    }

    if (r.error()) {
        return keyfix_core::Err<Animation>(*r.error());
    }
    return keyfix_core::Ok(std::move(anim));
}

/// Only primitive attribute maps are modeled
Mesh parse_mesh(const nlohmann::json& j) {
    Mesh mesh;
    if (!j.is_object()) {
        return mesh;
    }
    if (j.contains("name") && j["name"].is_string()) {
        mesh.name = j["name"].get<std::string>();
    }
    if (!j.contains("primitives") || !j["primitives"].is_array()) {
        return mesh;
    }
    for (const auto& pj : j["primitives"]) {
        MeshPrimitive prim;
        if (pj.is_object() && pj.contains("attributes") && pj["attributes"].is_object()) {
            for (const auto& [name, value] : pj["attributes"].items()) {
                if (value.is_number_integer()) {
                    prim.attributes[name] = value.get<std::int64_t>();
                }
            }
        }
        mesh.primitives.push_back(std::move(prim));
    }
    return mesh;
}

bool in_range(std::int64_t index, std::size_t size) {
    return index >= 0 && static_cast<std::size_t>(index) < size;
}

/// Validate every cross reference once and record the dangling ones
void link_references(Scene& scene) {
    auto add_issue = [&scene](const char* owner, std::size_t owner_index, std::string field,
                              std::int64_t target, std::size_t limit) {
        scene.reference_issues.push_back(ReferenceIssue{
            owner, static_cast<std::int64_t>(owner_index), std::move(field), target, limit});
    };

    for (std::size_t i = 0; i < scene.accessors.size(); ++i) {
        const auto& accessor = scene.accessors[i];
        if (accessor.buffer_view && !in_range(*accessor.buffer_view, scene.buffer_views.size())) {
            add_issue("accessor", i, "bufferView", *accessor.buffer_view, scene.buffer_views.size());
        }
    }

    for (std::size_t i = 0; i < scene.buffer_views.size(); ++i) {
        const auto& view = scene.buffer_views[i];
        if (!in_range(view.buffer, scene.buffers.size())) {
            add_issue("bufferView", i, "buffer", view.buffer, scene.buffers.size());
        }
    }

    for (std::size_t a = 0; a < scene.animations.size(); ++a) {
        const auto& anim = scene.animations[a];
        for (std::size_t s = 0; s < anim.samplers.size(); ++s) {
            const auto& sampler = anim.samplers[s];
            if (!in_range(sampler.input, scene.accessors.size())) {
                add_issue("animation", a, "samplers[" + std::to_string(s) + "].input accessor",
                    sampler.input, scene.accessors.size());
            }
            if (!in_range(sampler.output, scene.accessors.size())) {
                add_issue("animation", a, "samplers[" + std::to_string(s) + "].output accessor",
                    sampler.output, scene.accessors.size());
            }
        }
        for (std::size_t c = 0; c < anim.channels.size(); ++c) {
            if (!in_range(anim.channels[c].sampler, anim.samplers.size())) {
                add_issue("animation", a, "channels[" + std::to_string(c) + "].sampler",
                    anim.channels[c].sampler, anim.samplers.size());
            }
        }
    }

    for (std::size_t m = 0; m < scene.meshes.size(); ++m) {
        for (const auto& prim : scene.meshes[m].primitives) {
            for (const auto& [name, index] : prim.attributes) {
                if (!in_range(index, scene.accessors.size())) {
                    add_issue("mesh", m, name + " accessor", index, scene.accessors.size());
                }
            }
        }
    }
}

bool same_file(const fs::path& a, const fs::path& b) {
    if (a.empty() || b.empty()) {
        return false;
    }
    std::error_code ec;
    if (fs::exists(a, ec) && fs::exists(b, ec)) {
        bool equal = fs::equivalent(a, b, ec);
        if (!ec) {
            return equal;
        }
    }
    auto ca = fs::weakly_canonical(a, ec);
    if (ec) return a.lexically_normal() == b.lexically_normal();
    auto cb = fs::weakly_canonical(b, ec);
    if (ec) return a.lexically_normal() == b.lexically_normal();
    return ca == cb;
}

/// Binary path as written into buffers[0].uri
std::string relative_uri(const fs::path& metadata, const fs::path& binary) {
    fs::path base = metadata.parent_path();
    if (base.empty()) {
        base = ".";
    }
    std::error_code ec;
    fs::path rel = fs::relative(binary, base, ec);
    if (ec || rel.empty()) {
        rel = binary.filename();
    }
    return rel.generic_string();
}

} // anonymous namespace

// =============================================================================
// Output Paths
// =============================================================================

OutputPaths default_output_paths(const fs::path& input, const std::string& suffix) {
    fs::path dir = input.parent_path();
    std::string stem = input.stem().string() + suffix;
    return OutputPaths{dir / (stem + ".gltf"), dir / (stem + ".bin")};
}

OutputPaths output_paths_for(const fs::path& metadata) {
    fs::path binary = metadata;
    binary.replace_extension(".bin");
    return OutputPaths{metadata, binary};
}

// =============================================================================
// Parsing
// =============================================================================

keyfix_core::Result<Scene> parse_scene(
    nlohmann::json document,
    std::vector<std::uint8_t> payload,
    const fs::path& source_path)
{
    if (auto layout = check_layout(document, source_path); !layout) {
        return keyfix_core::Err<Scene>(layout.error());
    }

    Scene scene;
    scene.source_path = source_path;

    auto buffer = parse_buffer(document["buffers"][0], 0);
    if (!buffer) {
        return keyfix_core::Err<Scene>(buffer.error());
    }
    buffer->data = std::move(payload);
    scene.buffers.push_back(std::move(*buffer));

    const auto& views = document["bufferViews"];
    scene.buffer_views.reserve(views.size());
    for (std::size_t i = 0; i < views.size(); ++i) {
        auto view = parse_buffer_view(views[i], i);
        if (!view) {
            return keyfix_core::Err<Scene>(view.error());
        }
        scene.buffer_views.push_back(std::move(*view));
    }

    const auto& accessors = document["accessors"];
    scene.accessors.reserve(accessors.size());
    for (std::size_t i = 0; i < accessors.size(); ++i) {
        auto accessor = parse_accessor(accessors[i], i);
        if (!accessor) {
            return keyfix_core::Err<Scene>(accessor.error());
        }
        scene.accessors.push_back(std::move(*accessor));
    }

    if (document.contains("animations")) {
        const auto& animations = document["animations"];
        if (!animations.is_array()) {
            return keyfix_core::Err<Scene>(FormatError::invalid_field("animations", "expected an array"));
        }
        for (std::size_t i = 0; i < animations.size(); ++i) {
            auto anim = parse_animation(animations[i], i);
            if (!anim) {
                return keyfix_core::Err<Scene>(anim.error());
            }
            scene.animations.push_back(std::move(*anim));
        }
    }

    if (document.contains("meshes") && document["meshes"].is_array()) {
        for (const auto& mj : document["meshes"]) {
            scene.meshes.push_back(parse_mesh(mj));
        }
    }

    scene.has_scenes = document.contains("scenes");
    scene.has_nodes = document.contains("nodes");
    scene.document = std::move(document);

    link_references(scene);
    for (const auto& issue : scene.reference_issues) {
        keyfix_core::scene_logger()->warn("{}", issue.message());
    }

    return keyfix_core::Ok(std::move(scene));
}

keyfix_core::Result<Scene> load_scene(const fs::path& metadata_path) {
    auto log = keyfix_core::scene_logger();
    std::error_code ec;

    if (!fs::exists(metadata_path, ec)) {
        return keyfix_core::Err<Scene>(IoError::open_failed(metadata_path.string()));
    }

    std::ifstream file(metadata_path, std::ios::binary);
    if (!file.is_open()) {
        return keyfix_core::Err<Scene>(IoError::open_failed(metadata_path.string()));
    }
    std::stringstream text;
    text << file.rdbuf();
    if (file.bad()) {
        return keyfix_core::Err<Scene>(IoError::read_failed(metadata_path.string()));
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(text.str());
    } catch (const nlohmann::json::parse_error& e) {
        return keyfix_core::Err<Scene>(FormatError::unparseable(metadata_path.string(), e.what()));
    }

    if (auto layout = check_layout(document, metadata_path); !layout) {
        return keyfix_core::Err<Scene>(layout.error());
    }

    const auto& buffer_json = document["buffers"][0];
    if (!buffer_json.contains("uri") || !buffer_json["uri"].is_string()) {
        return keyfix_core::Err<Scene>(FormatError::unsupported_buffer("buffer has no external uri"));
    }
    std::string uri = buffer_json["uri"].get<std::string>();
    if (uri.rfind("data:", 0) == 0) {
        return keyfix_core::Err<Scene>(FormatError::unsupported_buffer("embedded data URIs are not supported"));
    }

    fs::path binary_path = metadata_path.parent_path() / fs::path(uri);
    if (!fs::exists(binary_path, ec)) {
        return keyfix_core::Err<Scene>(FormatError::missing_binary(binary_path.string()));
    }

    std::ifstream bin(binary_path, std::ios::binary);
    if (!bin.is_open()) {
        return keyfix_core::Err<Scene>(IoError::open_failed(binary_path.string()));
    }
    std::vector<std::uint8_t> payload(
        (std::istreambuf_iterator<char>(bin)),
        std::istreambuf_iterator<char>());
    if (bin.bad()) {
        return keyfix_core::Err<Scene>(IoError::read_failed(binary_path.string()));
    }

    auto scene = parse_scene(std::move(document), std::move(payload), metadata_path);
    if (!scene) {
        return scene;
    }
    scene->binary_path = binary_path;

    const Buffer& buffer = scene->buffers.front();
    if (buffer.declared_length != buffer.data.size()) {
        log->warn("Buffer '{}' declares {} bytes but file holds {}",
            buffer.uri, buffer.declared_length, buffer.data.size());
    }

    log->info("Loaded {}: {} accessors, {} bufferViews, {} animations, {} samplers, {} bytes",
        metadata_path.string(), scene->accessors.size(), scene->buffer_views.size(),
        scene->animations.size(), scene->sampler_count(), buffer.data.size());

    return scene;
}

// =============================================================================
// Writing
// =============================================================================

void sync_document(Scene& scene, const std::string& buffer_uri) {
    auto& doc = scene.document;

    if (doc.contains("accessors") && doc["accessors"].is_array()) {
        auto& accessors = doc["accessors"];
        for (std::size_t i = 0; i < scene.accessors.size() && i < accessors.size(); ++i) {
            const auto& accessor = scene.accessors[i];
            if (!accessor.bounds_modified) {
                continue;
            }
            accessors[i]["min"] = accessor.min;
            accessors[i]["max"] = accessor.max;
        }
    }

    if (!scene.buffers.empty() && doc.contains("buffers") && doc["buffers"].is_array() && !doc["buffers"].empty()) {
        auto& buffer = doc["buffers"][0];
        buffer["uri"] = buffer_uri;
        buffer["byteLength"] = scene.buffers.front().data.size();
    }
}

keyfix_core::Result<void> write_scene(
    Scene& scene,
    const fs::path& output_metadata,
    const fs::path& output_binary)
{
    auto log = keyfix_core::scene_logger();

    for (const auto& out : {output_metadata, output_binary}) {
        if (same_file(out, scene.source_path) || same_file(out, scene.binary_path)) {
            return Error(IoError::would_overwrite_input(out.string()));
        }
    }
    if (same_file(output_metadata, output_binary)) {
        return Error(keyfix_core::ErrorCode::InvalidArgument,
            "Metadata and binary outputs resolve to the same file: " + output_metadata.string());
    }
    if (scene.buffers.empty()) {
        return Error(keyfix_core::ErrorCode::InvalidState, "Scene holds no buffer to write");
    }

    std::error_code ec;
    for (const auto& out : {output_metadata, output_binary}) {
        if (out.has_parent_path()) {
            fs::create_directories(out.parent_path(), ec);
            if (ec) {
                return Error(IoError::write_failed(out.parent_path().string()));
            }
        }
    }

    std::string uri = relative_uri(output_metadata, output_binary);
    sync_document(scene, uri);
    scene.buffers.front().uri = uri;

    {
        std::ofstream meta(output_metadata, std::ios::binary | std::ios::trunc);
        if (!meta.is_open()) {
            return Error(IoError::open_failed(output_metadata.string()));
        }
        meta << scene.document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
        if (!meta) {
            return Error(IoError::write_failed(output_metadata.string()));
        }
    }

    {
        const auto& data = scene.buffers.front().data;
        std::ofstream bin(output_binary, std::ios::binary | std::ios::trunc);
        if (!bin.is_open()) {
            return Error(IoError::open_failed(output_binary.string()));
        }
        bin.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!bin) {
            return Error(IoError::write_failed(output_binary.string()));
        }
    }

    log->info("Wrote {} and {} ({} bytes)", output_metadata.string(), output_binary.string(),
        scene.buffers.front().data.size());

    return keyfix_core::Ok();
}

} // namespace keyfix_scene
