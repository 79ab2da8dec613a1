#pragma once
#include <toad/core/diagnostics.h>
#include <toad/core/lifecycle.h>
#include <toad/css/parser/stylesheet.h>
#include <toad/css/style/style_resolver.h>
#include <toad/dom/document.h>
#include <toad/engine/resource_loader.h>
#include <toad/form/form.h>
#include <toad/layout/layout_engine.h>
#include <toad/paint/painter.h>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toad::engine {

struct PipelineOptions {
    int viewport_columns = core::config::kDefaultViewportColumns;
    int viewport_rows = core::config::kDefaultViewportRows;
    bool images_enabled = true;
    css::SystemColors colors;
};

// One loaded document with everything derived from it: author sheets,
// decoded images, computed styles, form state and the current layout.
// Layout is redone wholesale on resize; styles only on theme change.
class RenderPipeline {
public:
    RenderPipeline(url::URL url, dom::Document document, std::vector<css::StyleSheet> sheets,
                   const PipelineOptions& options);

    // Parses a fetched resource and loads its stylesheets and images
    // through loader. Returns nullptr and sets err for content that cannot
    // be displayed.
    static std::unique_ptr<RenderPipeline> build(const Resource& resource, ResourceLoader& loader,
                                                 const PipelineOptions& options,
                                                 core::DiagnosticEmitter* diagnostics,
                                                 core::LifecycleTrace* trace, std::string& err);

    const url::URL& url() const { return url_; }
    const url::URL& base_url() const { return base_url_; }
    const std::string& title() const { return title_; }
    int status() const { return status_; }
    void set_status(int status) { status_ = status; }

    const dom::Document& document() const { return document_; }
    const css::StyleMap& styles() const { return styles_; }

    form::FormState& form_state() { return form_state_; }
    const form::FormState& form_state() const { return form_state_; }

    // Target of <meta http-equiv=refresh> with a url, resolved.
    const std::optional<url::URL>& refresh_target() const { return refresh_target_; }

    void restyle(const css::SystemColors& colors);
    void relayout(int columns, int rows);
    // Recomputes layout after form state changed.
    void relayout() { relayout(columns_, rows_); }

    void set_image(dom::NodeId image, paint::PixelMatrix pixels);
    void set_images_enabled(bool enabled);
    bool images_enabled() const { return images_enabled_; }
    // Fetches and decodes every <img> that has no pixels yet.
    void load_images(ResourceLoader& loader, core::DiagnosticEmitter* diagnostics);

    const layout::LayoutTree& layout_tree() const { return layout_; }
    const std::vector<layout::FocusTarget>& focus_targets() const { return focus_targets_; }
    int document_height() const { return layout_.height; }
    int layout_columns() const { return columns_; }
    int layout_rows() const { return rows_; }
    int layout_count() const { return layout_count_; }

    // First row of the element's content, for fragment navigation.
    std::optional<int> row_of(dom::NodeId element) const;
    std::optional<dom::NodeId> element_by_anchor(const std::string& name) const;

    // href of a link resolved against the base URL.
    std::optional<url::URL> link_target(dom::NodeId link) const;

    paint::CellGrid paint(paint::PaintOptions options) const;

private:
    std::optional<layout::CellSize> image_footprint(dom::NodeId image) const;
    void extract_metadata();

    url::URL url_;
    url::URL base_url_;
    dom::Document document_;
    std::vector<css::StyleSheet> sheets_;
    css::StyleMap styles_;
    std::map<dom::NodeId, paint::PixelMatrix> images_;
    form::FormState form_state_;
    std::string title_;
    std::optional<url::URL> refresh_target_;
    int status_ = 200;
    bool images_enabled_ = true;

    int columns_ = 0;
    int rows_ = 0;
    layout::LayoutTree layout_;
    std::vector<layout::FocusTarget> focus_targets_;
    int layout_count_ = 0;
};

// Parsed author stylesheets of document in document order: <style>
// contents and fetched <link rel=stylesheet> resources.
std::vector<css::StyleSheet> collect_author_sheets(const dom::Document& document,
                                                   const url::URL& base, ResourceLoader* loader,
                                                   core::DiagnosticEmitter* diagnostics);

// "5; url=next.html" -> "next.html". Empty when no url part is present.
std::string parse_refresh_url(const std::string& content);

} // namespace toad::engine
