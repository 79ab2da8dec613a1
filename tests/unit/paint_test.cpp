#include <gtest/gtest.h>
#include <toad/css/parser/stylesheet.h>
#include <toad/css/style/style_resolver.h>
#include <toad/css/style/user_agent.h>
#include <toad/html/tree_builder.h>
#include <toad/layout/layout_engine.h>
#include <toad/paint/ansi_writer.h>
#include <toad/paint/cell_grid.h>
#include <toad/paint/color_quantizer.h>
#include <toad/paint/image_decoder.h>
#include <toad/paint/image_reducer.h>
#include <toad/paint/painter.h>

#include <string>
#include <vector>

using namespace toad;
using namespace toad::paint;

namespace {

struct Page {
    dom::Document document;
    css::StyleMap styles;
    layout::LayoutTree tree;
};

Page build_page(const std::string& html, int columns, int rows,
                layout::LayoutOptions options = {}) {
    Page page;
    page.document = html::parse(html);
    css::StyleResolver resolver(css::default_user_agent_stylesheet());
    page.styles = resolver.resolve_document(page.document);
    options.viewport_columns = columns;
    options.viewport_rows = rows;
    page.tree = layout::LayoutEngine().layout(page.document, page.styles, options);
    return page;
}

CellGrid paint_page(const Page& page, int columns, int rows, int scroll = 0) {
    PaintOptions options;
    options.columns = columns;
    options.rows = rows;
    options.scroll_row = scroll;
    return Painter().paint(page.tree, options);
}

dom::NodeId by_id(const dom::Document& doc, const std::string& id) {
    for (dom::NodeId n = 0; n < doc.size(); ++n) {
        const std::string* value = doc.node(n).attribute("id");
        if (value && *value == id) return n;
    }
    ADD_FAILURE() << "no element with id " << id;
    return dom::Document::kRoot;
}

PixelMatrix solid(int w, int h, css::Color c) {
    PixelMatrix m;
    m.width = w;
    m.height = h;
    for (int i = 0; i < w * h; ++i) {
        m.rgba.push_back(c.r);
        m.rgba.push_back(c.g);
        m.rgba.push_back(c.b);
        m.rgba.push_back(c.a);
    }
    return m;
}

} // namespace

// =============================================================================
// CellGrid
// =============================================================================
TEST(CellGridTest, StartsBlank) {
    CellGrid grid(5, 3);
    EXPECT_EQ(grid.columns(), 5);
    EXPECT_EQ(grid.rows(), 3);
    EXPECT_EQ(grid.row_text(0), "");
    EXPECT_EQ(grid.to_text(), "");
    EXPECT_TRUE(grid.in_bounds(2, 4));
    EXPECT_FALSE(grid.in_bounds(3, 0));
    EXPECT_FALSE(grid.in_bounds(0, -1));
}

TEST(CellGridTest, PutTextClipsAtEdge) {
    CellGrid grid(5, 2);
    int used = grid.put_text(0, 2, "hello", Cell{});
    EXPECT_EQ(used, 3);
    EXPECT_EQ(grid.row_text(0), "  hel");
}

TEST(CellGridTest, PutTextHonorsLimit) {
    CellGrid grid(10, 1);
    EXPECT_EQ(grid.put_text(0, 0, "abcdef", Cell{}, 4), 4);
    EXPECT_EQ(grid.row_text(0), "abcd");
}

TEST(CellGridTest, OutOfBoundsWritesDropped) {
    CellGrid grid(3, 1);
    grid.put_glyph(5, 0, "x", Cell{});
    grid.put_glyph(0, -1, "x", Cell{});
    EXPECT_EQ(grid.to_text(), "");
}

TEST(CellGridTest, WideGlyphOccupiesTwoCells) {
    CellGrid grid(4, 1);
    grid.put_text(0, 0, "\xE4\xBD\xA0" "a", Cell{});
    EXPECT_TRUE(grid.at(0, 1).continuation);
    EXPECT_EQ(grid.at(0, 2).glyph, "a");
    EXPECT_EQ(grid.row_text(0), "\xE4\xBD\xA0" "a");
}

TEST(CellGridTest, WideGlyphAtRightEdgeBecomesSpace) {
    CellGrid grid(3, 1);
    grid.put_glyph(0, 2, "\xE4\xBD\xA0", Cell{});
    EXPECT_EQ(grid.at(0, 2).glyph, " ");
}

TEST(CellGridTest, OverwritingHalfOfWideGlyphClearsOtherHalf) {
    CellGrid grid(4, 1);
    grid.put_glyph(0, 0, "\xE4\xBD\xA0", Cell{});
    grid.put_glyph(0, 1, "x", Cell{});
    EXPECT_EQ(grid.at(0, 0).glyph, " ");
    EXPECT_EQ(grid.row_text(0), " x");
}

TEST(CellGridTest, WideGlyphOverlappingWideGlyphLeavesNoOrphan) {
    CellGrid grid(6, 1);
    grid.put_text(0, 0, "\xE4\xB8\xAD\xE6\x96\x87", Cell{});
    ASSERT_TRUE(grid.at(0, 3).continuation);
    grid.put_glyph(0, 1, "\xE4\xBD\xA0", Cell{});
    EXPECT_EQ(grid.at(0, 0).glyph, " ");
    EXPECT_TRUE(grid.at(0, 2).continuation);
    EXPECT_FALSE(grid.at(0, 3).continuation);
    EXPECT_EQ(grid.at(0, 3).glyph, " ");
    EXPECT_EQ(grid.row_text(0), " \xE4\xBD\xA0");
}

TEST(CellGridTest, ControlCharactersDropped) {
    CellGrid grid(3, 1);
    grid.put_text(0, 0, "a\x07" "b", Cell{});
    EXPECT_EQ(grid.row_text(0), "ab");
    grid.put_glyph(0, 2, "\x1b", Cell{});
    EXPECT_EQ(grid.at(0, 2).glyph, " ");
}

TEST(CellGridTest, FillBackgroundClips) {
    CellGrid grid(3, 3);
    css::Color red{255, 0, 0, 255};
    grid.fill_background(-1, 1, 10, 2, red);
    EXPECT_EQ(grid.at(0, 1).background, red);
    EXPECT_EQ(grid.at(0, 2).background, red);
    EXPECT_NE(grid.at(0, 0).background, red);
    EXPECT_NE(grid.at(1, 1).background, red);
}

TEST(CellGridTest, ToTextDropsTrailingBlankRows) {
    CellGrid grid(4, 4);
    grid.put_text(0, 0, "a", Cell{});
    grid.put_text(2, 1, "b", Cell{});
    EXPECT_EQ(grid.to_text(), "a\n\n b");
}

// =============================================================================
// Colors
// =============================================================================
TEST(ColorQuantizerTest, DetectMode) {
    EXPECT_EQ(detect_color_mode("truecolor"), ColorMode::TrueColor);
    EXPECT_EQ(detect_color_mode("24bit"), ColorMode::TrueColor);
    EXPECT_EQ(detect_color_mode(""), ColorMode::Palette256);
    EXPECT_EQ(detect_color_mode(nullptr), ColorMode::Palette256);
}

TEST(ColorQuantizerTest, PaletteEntries) {
    EXPECT_EQ(palette_color(16), (css::Color{0, 0, 0, 255}));
    EXPECT_EQ(palette_color(196), (css::Color{255, 0, 0, 255}));
    EXPECT_EQ(palette_color(231), (css::Color{255, 255, 255, 255}));
    EXPECT_EQ(palette_color(232), (css::Color{8, 8, 8, 255}));
    EXPECT_EQ(palette_color(255), (css::Color{238, 238, 238, 255}));
}

TEST(ColorQuantizerTest, NearestIndex) {
    EXPECT_EQ(nearest_palette_index({255, 0, 0, 255}), 196);
    EXPECT_EQ(nearest_palette_index({0, 0, 255, 255}), 21);
    EXPECT_EQ(nearest_palette_index({255, 255, 255, 255}), 231);
    int gray = nearest_palette_index({118, 118, 118, 255});
    EXPECT_GE(gray, 232);
}

TEST(ColorQuantizerTest, QuantizeKeepsAlphaAndTrueColor) {
    css::Color c{12, 34, 56, 200};
    EXPECT_EQ(quantize(c, ColorMode::TrueColor), c);
    EXPECT_EQ(quantize(c, ColorMode::Palette256).a, 200);
}

TEST(ColorQuantizerTest, Blend) {
    css::Color white = css::Color::white();
    EXPECT_EQ(blend(css::Color::transparent(), white), white);
    EXPECT_EQ(blend({10, 20, 30, 255}, white), (css::Color{10, 20, 30, 255}));
    css::Color half = blend({0, 0, 0, 128}, white);
    EXPECT_EQ(half.a, 255);
    EXPECT_NEAR(half.r, 127, 1);
}

// =============================================================================
// Images
// =============================================================================
TEST(ImageReducerTest, NaturalFootprint) {
    Footprint f = natural_footprint(160, 64);
    EXPECT_EQ(f.columns, 20);
    EXPECT_EQ(f.rows, 4);
    Footprint tiny = natural_footprint(1, 1);
    EXPECT_EQ(tiny.columns, 1);
    EXPECT_EQ(tiny.rows, 1);
    Footprint zero = natural_footprint(0, 0);
    EXPECT_EQ(zero.columns, 1);
    EXPECT_EQ(zero.rows, 1);
}

TEST(ImageReducerTest, BlockAverageSolid) {
    css::Color green{0, 200, 0, 255};
    auto cells = reduce_image(solid(16, 16, green), 2, 2, ReductionMode::BlockAverage,
                              css::Color::white());
    ASSERT_EQ(cells.size(), 4u);
    for (const auto& cell : cells) {
        EXPECT_EQ(cell.background, green);
        EXPECT_EQ(cell.glyph, " ");
    }
}

TEST(ImageReducerTest, HalfBlockSplitsRows) {
    PixelMatrix m = solid(1, 2, {255, 0, 0, 255});
    m.rgba[4] = 0;
    m.rgba[5] = 0;
    m.rgba[6] = 255;
    auto cells = reduce_image(m, 1, 1, ReductionMode::HalfBlock, css::Color::white());
    ASSERT_EQ(cells.size(), 1u);
    EXPECT_EQ(cells[0].glyph, "▀");
    EXPECT_EQ(cells[0].foreground, (css::Color{255, 0, 0, 255}));
    EXPECT_EQ(cells[0].background, (css::Color{0, 0, 255, 255}));
}

TEST(ImageReducerTest, TransparentBlendsIntoBackground) {
    css::Color page{10, 20, 30, 255};
    auto cells = reduce_image(solid(4, 4, css::Color::transparent()), 1, 1,
                              ReductionMode::BlockAverage, page);
    ASSERT_EQ(cells.size(), 1u);
    EXPECT_EQ(cells[0].background, page);
}

TEST(ImageReducerTest, UpscalesSmallImage) {
    auto cells = reduce_image(solid(1, 1, {1, 2, 3, 255}), 3, 2, ReductionMode::HalfBlock,
                              css::Color::white());
    ASSERT_EQ(cells.size(), 6u);
    for (const auto& cell : cells) EXPECT_EQ(cell.foreground, (css::Color{1, 2, 3, 255}));
}

TEST(ImageReducerTest, InvalidInputYieldsNothing) {
    PixelMatrix empty;
    EXPECT_TRUE(reduce_image(empty, 2, 2, ReductionMode::HalfBlock, css::Color::white()).empty());
    EXPECT_TRUE(reduce_image(solid(2, 2, css::Color::black()), 0, 2, ReductionMode::HalfBlock,
                             css::Color::white())
                    .empty());
}

TEST(ImageDecoderTest, DecodesBitmap) {
    // 1x1 24-bit BMP holding one red pixel.
    std::vector<std::uint8_t> bmp = {
        'B', 'M', 58, 0, 0, 0, 0, 0, 0, 0, 54, 0, 0, 0,
        40, 0, 0, 0, 1, 0, 0, 0, 1, 0, 0, 0, 1, 0, 24, 0,
        0, 0, 0, 0, 4, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
        0, 0, 0, 0, 0, 0, 0, 0,
        0x00, 0x00, 0xFF, 0x00};
    std::string err;
    auto image = decode_image(bmp, err);
    ASSERT_TRUE(image.has_value()) << err;
    EXPECT_EQ(image->width, 1);
    EXPECT_EQ(image->height, 1);
    EXPECT_TRUE(image->valid());
    EXPECT_EQ(image->at(0, 0), (css::Color{255, 0, 0, 255}));
}

TEST(ImageDecoderTest, GarbageReportsError) {
    std::string err;
    EXPECT_FALSE(decode_image({1, 2, 3, 4, 5}, err).has_value());
    EXPECT_FALSE(err.empty());
    err.clear();
    EXPECT_FALSE(decode_image({}, err).has_value());
    EXPECT_EQ(err, "empty image data");
}

// =============================================================================
// Painter
// =============================================================================
TEST(PainterTest, PaintsTextAtLayoutPosition) {
    Page page = build_page("<p>hello</p>", 20, 5);
    CellGrid grid = paint_page(page, 20, 5);
    EXPECT_EQ(grid.row_text(0), "");
    EXPECT_EQ(grid.row_text(1), " hello");
}

TEST(PainterTest, ScrollShiftsRows) {
    Page page = build_page("<p>hello</p>", 20, 5);
    CellGrid grid = paint_page(page, 20, 5, 1);
    EXPECT_EQ(grid.row_text(0), " hello");
}

TEST(PainterTest, RepaintIsIdentical) {
    Page page = build_page("<h1>T</h1><p>a <b>b</b> <a href=x>c</a></p><ul><li>x</ul>", 30, 10);
    EXPECT_EQ(paint_page(page, 30, 10), paint_page(page, 30, 10));
}

TEST(PainterTest, HeadingColorAndBold) {
    Page page = build_page("<h1>T</h1>", 10, 4);
    CellGrid grid = paint_page(page, 10, 4);
    const Cell& cell = grid.at(1, 1);
    EXPECT_EQ(cell.glyph, "T");
    EXPECT_TRUE(cell.attributes.bold);
    EXPECT_EQ(cell.foreground, (css::Color{0xcc, 0, 0, 255}));
}

TEST(PainterTest, LinksUnderlinedAndFocusReversed) {
    Page page = build_page("<p><a id=a href=/x>go</a></p>", 10, 4);
    PaintOptions options;
    options.columns = 10;
    options.rows = 4;
    CellGrid plain = Painter().paint(page.tree, options);
    EXPECT_TRUE(plain.at(1, 1).attributes.underline);
    EXPECT_FALSE(plain.at(1, 1).attributes.reverse);

    options.focused = by_id(page.document, "a");
    CellGrid focused = Painter().paint(page.tree, options);
    EXPECT_TRUE(focused.at(1, 1).attributes.reverse);
    EXPECT_TRUE(focused.at(1, 2).attributes.reverse);
}

TEST(PainterTest, BackgroundFillsBlock) {
    Page page = build_page("<div style='background-color: red'>x</div>", 10, 4);
    CellGrid grid = paint_page(page, 10, 4);
    EXPECT_EQ(grid.at(0, 1).background, (css::Color{255, 0, 0, 255}));
    EXPECT_EQ(grid.at(0, 8).background, (css::Color{255, 0, 0, 255}));
    EXPECT_EQ(grid.at(0, 0).background, css::Color::white());
}

TEST(PainterTest, BorderDrawsBoxGlyphs) {
    Page page = build_page("<div style='border: 1px solid'>x</div>", 8, 5);
    CellGrid grid = paint_page(page, 8, 5);
    EXPECT_EQ(grid.row_text(0), " ┌────┐");
    EXPECT_EQ(grid.row_text(1), " │x   │");
    EXPECT_EQ(grid.row_text(2), " └────┘");
}

TEST(PainterTest, ListMarkerPainted) {
    Page page = build_page("<ul><li>item</ul>", 20, 4);
    CellGrid grid = paint_page(page, 20, 4);
    EXPECT_EQ(grid.row_text(1), "  • item");
}

TEST(PainterTest, ImageWithoutPixelsShaded) {
    layout::LayoutOptions options;
    options.image_size = [](dom::NodeId) {
        return std::optional<layout::CellSize>(layout::CellSize{2, 1});
    };
    Page page = build_page("<img src=x.png>", 10, 3, options);
    CellGrid grid = paint_page(page, 10, 3);
    EXPECT_EQ(grid.row_text(0), " ░░");
}

TEST(PainterTest, ImagePixelsReduced) {
    layout::LayoutOptions layout_options;
    layout_options.image_size = [](dom::NodeId) {
        return std::optional<layout::CellSize>(layout::CellSize{2, 1});
    };
    Page page = build_page("<img src=x.png>", 10, 3, layout_options);
    PixelMatrix pixels = solid(4, 4, {0, 0, 255, 255});
    PaintOptions options;
    options.columns = 10;
    options.rows = 3;
    options.images = [&](dom::NodeId) { return &pixels; };
    CellGrid grid = Painter().paint(page.tree, options);
    EXPECT_EQ(grid.at(0, 1).glyph, "▀");
    EXPECT_EQ(grid.at(0, 1).foreground, (css::Color{0, 0, 255, 255}));
}

TEST(PainterTest, PaletteModeQuantizes) {
    Page page = build_page("<h1>T</h1>", 10, 4);
    PaintOptions options;
    options.columns = 10;
    options.rows = 4;
    options.color_mode = ColorMode::Palette256;
    CellGrid grid = Painter().paint(page.tree, options);
    EXPECT_EQ(grid.at(1, 1).foreground, palette_color(nearest_palette_index({0xcc, 0, 0, 255})));
}

// =============================================================================
// ANSI output
// =============================================================================
TEST(AnsiWriterTest, SgrParameters) {
    Cell cell;
    cell.attributes.bold = true;
    cell.attributes.underline = true;
    cell.foreground = {1, 2, 3, 255};
    cell.background = {4, 5, 6, 255};
    EXPECT_EQ(sgr_parameters(cell, ColorMode::TrueColor), "0;1;4;38;2;1;2;3;48;2;4;5;6");
    cell.attributes = CellAttributes{};
    cell.foreground = {255, 0, 0, 255};
    cell.background = {255, 255, 255, 255};
    EXPECT_EQ(sgr_parameters(cell, ColorMode::Palette256), "0;38;5;196;48;5;231");
}

TEST(AnsiWriterTest, StyleEmittedOnlyOnChange) {
    CellGrid grid(3, 1);
    grid.put_text(0, 0, "abc", Cell{});
    std::string out = encode_ansi(grid, ColorMode::TrueColor);
    EXPECT_EQ(out, "\x1b[1;1H\x1b[0;38;2;0;0;0;48;2;255;255;255mabc\x1b[0m");
}

TEST(AnsiWriterTest, PositionsEachRowAndSkipsContinuations) {
    CellGrid grid(2, 2);
    grid.put_glyph(1, 0, "\xE4\xBD\xA0", Cell{});
    std::string out = encode_ansi(grid, ColorMode::TrueColor);
    EXPECT_NE(out.find("\x1b[1;1H"), std::string::npos);
    EXPECT_NE(out.find("\x1b[2;1H"), std::string::npos);
    std::string row2 = out.substr(out.find("\x1b[2;1H"));
    EXPECT_NE(row2.find("\xE4\xBD\xA0\x1b[0m"), std::string::npos);
}
