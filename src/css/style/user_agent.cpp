#include <toad/css/style/user_agent.h>

namespace toad::css {

namespace {

// Lengths are chosen to land on whole cells: 1lh is one row, 1ch one column.
constexpr std::string_view kUserAgentCss = R"css(
html, body, address, article, aside, blockquote, center, details, dialog,
dd, div, dl, dt, fieldset, figcaption, figure, footer, form, header, hgroup,
hr, main, menu, nav, ol, p, pre, section, summary, ul, h1, h2, h3, h4, h5, h6,
table, thead, tbody, tfoot, tr, caption, legend, noscript {
    display: block;
}
li { display: list-item; }
td, th { display: inline; }
th { font-weight: bold; }

head, script, style, title, template, link, meta, base, datalist, [hidden] {
    display: none;
}

body { margin: 0 1ch; }
p, dl, blockquote, figure, pre, ul, ol, table { margin: 1lh 0; }
ul ul, ul ol, ol ol, ol ul { margin: 0; }
ul, ol { padding-left: 3ch; }
ul { list-style-type: disc; }
ol { list-style-type: decimal; }
dd { margin-left: 4ch; }
blockquote { margin-left: 4ch; margin-right: 4ch; }

h1, h2, h3, h4, h5, h6 { font-weight: bold; margin: 1lh 0; }
h1, h2, h3 { color: #cc0000; }

b, strong { font-weight: bold; }
i, em, cite, var, dfn, address { font-style: italic; }
u, ins { text-decoration: underline; }
s, strike, del { text-decoration: line-through; }
pre, xmp, listing, plaintext { white-space: pre; }
textarea { white-space: pre-wrap; }
center { text-align: center; }
nobr { white-space: nowrap; }

a:link { color: LinkText; text-decoration: underline; }

hr { border-top: 1px solid; margin: 0; }
)css";

} // namespace

std::string_view user_agent_css() {
    return kUserAgentCss;
}

const StyleSheet& default_user_agent_stylesheet() {
    static const StyleSheet sheet = parse_stylesheet(kUserAgentCss, Origin::UserAgent);
    return sheet;
}

} // namespace toad::css
