#include <toad/engine/render_pipeline.h>

#include <toad/css/style/user_agent.h>
#include <toad/html/tree_builder.h>
#include <toad/paint/image_decoder.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <functional>

namespace toad::engine {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim_copy(const std::string& value) {
    size_t first = 0;
    while (first < value.size() && std::isspace(static_cast<unsigned char>(value[first]))) ++first;
    size_t last = value.size();
    while (last > first && std::isspace(static_cast<unsigned char>(value[last - 1]))) --last;
    return value.substr(first, last - first);
}

bool has_token(const std::string& list, const std::string& token) {
    std::string lowered = to_lower(list);
    size_t pos = 0;
    while (pos < lowered.size()) {
        while (pos < lowered.size() && std::isspace(static_cast<unsigned char>(lowered[pos]))) ++pos;
        size_t end = pos;
        while (end < lowered.size() && !std::isspace(static_cast<unsigned char>(lowered[end]))) ++end;
        if (lowered.compare(pos, end - pos, token) == 0 && end - pos == token.size()) return true;
        pos = end;
    }
    return false;
}

// Pre-order walk over elements.
void for_each_element(const dom::Document& document, dom::NodeId from,
                      const std::function<void(dom::NodeId)>& fn) {
    std::vector<dom::NodeId> stack{from};
    while (!stack.empty()) {
        dom::NodeId id = stack.back();
        stack.pop_back();
        if (document.node(id).is_element()) fn(id);
        const auto& children = document.children(id);
        for (auto it = children.rbegin(); it != children.rend(); ++it) stack.push_back(*it);
    }
}

bool media_applies(const dom::Node& node) {
    const std::string* media = node.attribute("media");
    return !media || css::media_query_applies(*media);
}

std::optional<int> parse_pixels(const std::string* value) {
    if (!value) return std::nullopt;
    std::string text = trim_copy(*value);
    if (text.size() > 2 && to_lower(text.substr(text.size() - 2)) == "px") {
        text.resize(text.size() - 2);
    }
    if (text.empty() || text.size() > 6 ||
        !std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    int px = std::stoi(text);
    if (px <= 0) return std::nullopt;
    return px;
}

std::string last_path_segment(const url::URL& target) {
    const std::string& path = target.path;
    auto slash = path.rfind('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    return name.empty() ? target.host : name;
}

dom::Document plain_text_document(const std::string& text) {
    dom::Document document;
    dom::NodeId html = document.create_element(dom::Document::kRoot, "html");
    document.create_element(html, "head");
    dom::NodeId body = document.create_element(html, "body");
    dom::NodeId pre = document.create_element(body, "pre");
    document.create_text(pre, text);
    return document;
}

dom::Document image_document(const std::string& alt, dom::NodeId& image) {
    dom::Document document;
    dom::NodeId html = document.create_element(dom::Document::kRoot, "html");
    dom::NodeId head = document.create_element(html, "head");
    dom::NodeId title = document.create_element(head, "title");
    document.create_text(title, alt);
    dom::NodeId body = document.create_element(html, "body");
    image = document.create_element(body, "img");
    document.set_attribute(image, "alt", alt);
    return document;
}

url::URL document_base(const dom::Document& document, const url::URL& document_url) {
    if (auto base = document.find_first("base")) {
        if (const std::string* href = document.node(*base).attribute("href")) {
            if (auto resolved = url::parse(trim_copy(*href), &document_url)) return *resolved;
        }
    }
    return document_url;
}

} // namespace

std::string parse_refresh_url(const std::string& content) {
    auto sep = content.find_first_of(";,");
    if (sep == std::string::npos) return "";
    std::string rest = trim_copy(content.substr(sep + 1));
    if (to_lower(rest).rfind("url", 0) == 0) {
        std::string after = trim_copy(rest.substr(3));
        if (!after.empty() && after.front() == '=') rest = trim_copy(after.substr(1));
    }
    if (rest.size() >= 2 && (rest.front() == '\'' || rest.front() == '"')) {
        char quote = rest.front();
        auto close = rest.find(quote, 1);
        rest = rest.substr(1, close == std::string::npos ? std::string::npos : close - 1);
    }
    return trim_copy(rest);
}

std::vector<css::StyleSheet> collect_author_sheets(const dom::Document& document,
                                                   const url::URL& base, ResourceLoader* loader,
                                                   core::DiagnosticEmitter* diagnostics) {
    std::vector<css::StyleSheet> sheets;
    auto report = [&](const css::StyleSheet& sheet, const std::string& source) {
        if (!diagnostics) return;
        for (const auto& warning : sheet.warnings) {
            diagnostics->emit(core::Severity::Info, "css", "parse", source + ": " + warning);
        }
    };

    for_each_element(document, dom::Document::kRoot, [&](dom::NodeId id) {
        const dom::Node& node = document.node(id);
        if (node.is_element("style")) {
            const std::string* type = node.attribute("type");
            if (type && !type->empty() && to_lower(trim_copy(*type)) != "text/css") return;
            if (!media_applies(node)) return;
            css::StyleSheet sheet = css::parse_stylesheet(document.text_content(id));
            report(sheet, "<style>");
            sheets.push_back(std::move(sheet));
            return;
        }
        if (!node.is_element("link") || !loader) return;
        const std::string* rel = node.attribute("rel");
        const std::string* href = node.attribute("href");
        if (!rel || !href || !has_token(*rel, "stylesheet") || has_token(*rel, "alternate")) return;
        if (!media_applies(node)) return;

        auto target = url::parse(trim_copy(*href), &base);
        if (!target) {
            if (diagnostics) {
                diagnostics->emit(core::Severity::Warning, "css", "fetch",
                                  "Unresolvable stylesheet href: " + *href);
            }
            return;
        }
        LoadResult loaded = loader->load(*target);
        if (!loaded.ok || loaded.resource.status >= 400) {
            if (diagnostics) {
                diagnostics->emit(core::Severity::Warning, "css", "fetch",
                                  "Stylesheet not loaded: " + target->serialize() +
                                      (loaded.ok ? "" : " (" + loaded.error + ")"));
            }
            return;
        }
        const std::string& type = loaded.resource.media_type;
        if (type != "text/css" && type != "text/plain") return;
        css::StyleSheet sheet = css::parse_stylesheet(loaded.resource.text());
        report(sheet, target->serialize());
        sheets.push_back(std::move(sheet));
    });
    return sheets;
}

RenderPipeline::RenderPipeline(url::URL url, dom::Document document,
                               std::vector<css::StyleSheet> sheets, const PipelineOptions& options)
    : url_(std::move(url)),
      document_(std::move(document)),
      sheets_(std::move(sheets)),
      images_enabled_(options.images_enabled) {
    extract_metadata();
    restyle(options.colors);
    relayout(options.viewport_columns, options.viewport_rows);
}

std::unique_ptr<RenderPipeline> RenderPipeline::build(const Resource& resource,
                                                      ResourceLoader& loader,
                                                      const PipelineOptions& options,
                                                      core::DiagnosticEmitter* diagnostics,
                                                      core::LifecycleTrace* trace,
                                                      std::string& err) {
    if (trace) trace->record(core::LifecycleStage::Parsing);
    const std::string& type = resource.media_type;

    dom::Document document;
    std::optional<paint::PixelMatrix> image_pixels;
    dom::NodeId image_node = dom::Document::kRoot;

    if (type.empty() || type == "text/html" || type == "application/xhtml+xml") {
        std::vector<std::string> warnings;
        document = html::parse(resource.text(), &warnings);
        if (diagnostics) {
            for (const auto& warning : warnings) {
                diagnostics->emit(core::Severity::Info, "html", "parse", warning);
            }
        }
    } else if (type.rfind("text/", 0) == 0) {
        document = plain_text_document(resource.text());
    } else if (type.rfind("image/", 0) == 0) {
        std::string decode_err;
        image_pixels = paint::decode_image(resource.body, decode_err);
        if (!image_pixels) {
            err = "Cannot decode image: " + decode_err;
            return nullptr;
        }
        document = image_document(last_path_segment(resource.url), image_node);
    } else {
        err = "Unsupported content type: " + type;
        return nullptr;
    }

    if (trace) trace->record(core::LifecycleStage::Styling);
    const url::URL base = document_base(document, resource.url);
    std::vector<css::StyleSheet> sheets =
        collect_author_sheets(document, base, &loader, diagnostics);

    auto pipeline = std::make_unique<RenderPipeline>(resource.url, std::move(document),
                                                     std::move(sheets), options);
    pipeline->set_status(resource.status);

    if (trace) trace->record(core::LifecycleStage::Layout);
    if (image_pixels) {
        pipeline->set_image(image_node, std::move(*image_pixels));
        pipeline->relayout();
    } else if (options.images_enabled) {
        pipeline->load_images(loader, diagnostics);
    }
    return pipeline;
}

void RenderPipeline::extract_metadata() {
    base_url_ = document_base(document_, url_);

    title_ = document_.title();
    if (title_.empty()) title_ = url_.scheme == "about" ? "New Tab" : url_.serialize();

    refresh_target_.reset();
    for (dom::NodeId meta : document_.find_all("meta")) {
        const dom::Node& node = document_.node(meta);
        const std::string* equiv = node.attribute("http-equiv");
        const std::string* content = node.attribute("content");
        if (!equiv || !content || to_lower(trim_copy(*equiv)) != "refresh") continue;
        std::string target = parse_refresh_url(*content);
        if (target.empty()) continue;
        if (auto resolved = url::parse(target, &base_url_)) {
            refresh_target_ = std::move(*resolved);
            break;
        }
    }
}

void RenderPipeline::restyle(const css::SystemColors& colors) {
    css::StyleResolver resolver(css::default_user_agent_stylesheet(), colors);
    for (const auto& sheet : sheets_) resolver.add_author_sheet(sheet);
    styles_ = resolver.resolve_document(document_);
}

void RenderPipeline::relayout(int columns, int rows) {
    columns_ = std::max(1, columns);
    rows_ = std::max(1, rows);

    layout::LayoutOptions options;
    options.viewport_columns = columns_;
    options.viewport_rows = rows_;
    options.form_state = &form_state_;
    options.image_size = [this](dom::NodeId image) { return image_footprint(image); };

    layout::LayoutEngine engine;
    layout_ = engine.layout(document_, styles_, options);
    focus_targets_ = layout::collect_focus_targets(*layout_.root);
    ++layout_count_;
}

void RenderPipeline::set_image(dom::NodeId image, paint::PixelMatrix pixels) {
    images_[image] = std::move(pixels);
}

void RenderPipeline::set_images_enabled(bool enabled) {
    if (images_enabled_ == enabled) return;
    images_enabled_ = enabled;
    relayout();
}

void RenderPipeline::load_images(ResourceLoader& loader, core::DiagnosticEmitter* diagnostics) {
    std::map<std::string, std::optional<paint::PixelMatrix>> fetched;
    bool changed = false;

    for (dom::NodeId image : document_.find_all("img")) {
        if (images_.count(image)) continue;
        const std::string* src = document_.node(image).attribute("src");
        if (!src || trim_copy(*src).empty()) continue;
        auto target = url::parse(trim_copy(*src), &base_url_);
        if (!target) continue;

        const std::string key = target->serialize_without_fragment();
        auto cached = fetched.find(key);
        if (cached == fetched.end()) {
            std::optional<paint::PixelMatrix> pixels;
            LoadResult loaded = loader.load(*target);
            if (loaded.ok && loaded.resource.status < 400) {
                std::string decode_err;
                pixels = paint::decode_image(loaded.resource.body, decode_err);
                if (!pixels && diagnostics) {
                    diagnostics->emit(core::Severity::Warning, "paint", "decode",
                                      key + ": " + decode_err);
                }
            } else if (diagnostics) {
                diagnostics->emit(core::Severity::Warning, "net", "fetch",
                                  "Image not loaded: " + key);
            }
            cached = fetched.emplace(key, std::move(pixels)).first;
        }
        if (cached->second) {
            images_[image] = *cached->second;
            changed = true;
        }
    }
    if (changed) relayout();
}

std::optional<layout::CellSize> RenderPipeline::image_footprint(dom::NodeId image) const {
    if (!images_enabled_) return std::nullopt;
    auto it = images_.find(image);
    if (it == images_.end() || !it->second.valid()) return std::nullopt;

    const paint::PixelMatrix& pixels = it->second;
    const dom::Node& node = document_.node(image);
    auto width = parse_pixels(node.attribute("width"));
    auto height = parse_pixels(node.attribute("height"));
    int w = pixels.width;
    int h = pixels.height;
    if (width && height) {
        w = *width;
        h = *height;
    } else if (width) {
        w = *width;
        h = static_cast<int>(std::lround(static_cast<double>(pixels.height) * *width / pixels.width));
    } else if (height) {
        h = *height;
        w = static_cast<int>(std::lround(static_cast<double>(pixels.width) * *height / pixels.height));
    }
    paint::Footprint footprint = paint::natural_footprint(std::max(1, w), std::max(1, h));
    return layout::CellSize{footprint.columns, footprint.rows};
}

std::optional<int> RenderPipeline::row_of(dom::NodeId element) const {
    if (!layout_.root) return std::nullopt;
    std::vector<const layout::Box*> stack{layout_.root.get()};
    while (!stack.empty()) {
        const layout::Box* box = stack.back();
        stack.pop_back();
        if (box->node && *box->node == element) return box->geometry.border_rect().y;
        for (auto it = box->children.rbegin(); it != box->children.rend(); ++it) {
            stack.push_back(it->get());
        }
    }
    return std::nullopt;
}

std::optional<dom::NodeId> RenderPipeline::element_by_anchor(const std::string& name) const {
    if (name.empty()) return std::nullopt;
    std::optional<dom::NodeId> found;
    for_each_element(document_, dom::Document::kRoot, [&](dom::NodeId id) {
        if (found) return;
        const dom::Node& node = document_.node(id);
        const std::string* value = node.attribute("id");
        if (!value && node.is_element("a")) value = node.attribute("name");
        if (value && *value == name) found = id;
    });
    return found;
}

std::optional<url::URL> RenderPipeline::link_target(dom::NodeId link) const {
    const std::string* href = document_.node(link).attribute("href");
    if (!href) return std::nullopt;
    return url::parse(trim_copy(*href), &base_url_);
}

paint::CellGrid RenderPipeline::paint(paint::PaintOptions options) const {
    options.images = [this](dom::NodeId image) -> const paint::PixelMatrix* {
        if (!images_enabled_) return nullptr;
        auto it = images_.find(image);
        return it == images_.end() ? nullptr : &it->second;
    };
    paint::Painter painter;
    return painter.paint(layout_, options);
}

} // namespace toad::engine
