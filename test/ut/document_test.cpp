//=============================================================================
// Document Tests
//
// YAML list and tree documents loaded by the yview tool
//=============================================================================

#include <boost/ut.hpp>
#include <yview/document.h>
#include <yview/flattened-view.h>
#include <yaml-cpp/yaml.h>

#include <string>

using namespace boost::ut;
using namespace yview;

suite document_tests = [] {
    "list of scalars and mappings"_test = [] {
        auto items = parseListDocument(
            "items:\n"
            "  - first\n"
            "  - text: \"two\\nlines\"\n"
            "    data: 42\n"
            "  - text: third\n"
            "    data: {kind: file}\n");
        expect(items.has_value()) << error_msg(items);
        if (!items) return;
        expect(items->size() == 3_ul);
        expect((*items)[0].text == "first");
        expect(!(*items)[0].data.has_value());
        expect((*items)[1].text == "two\nlines");
        expect(getAs<std::string>((*items)[1].data) == std::optional<std::string>("42"));
        auto node = getAs<YAML::Node>((*items)[2].data);
        expect(node.has_value() && node->IsMap());
        if (node) {
            expect((*node)["kind"].as<std::string>() == "file");
        }
    };

    "root sequence is accepted as a list"_test = [] {
        auto items = parseListDocument("[a, b, c]");
        expect(items.has_value());
        if (items) {
            expect(items->size() == 3_ul);
        }
    };

    "list errors"_test = [] {
        for (const char* doc : {"other: [a]", "items: 5", "items:\n  - [nested]", "items: [unterminated"}) {
            auto items = parseListDocument(doc);
            expect(!items.has_value()) << doc;
            if (!items) {
                expect(items.error().code() == ErrorCode::Parse);
            }
        }
    };

    "nested tree"_test = [] {
        auto roots = parseTreeDocument(
            "tree:\n"
            "  - label: src\n"
            "    expanded: true\n"
            "    children:\n"
            "      - main.cpp\n"
            "      - label: empty-dir\n"
            "        leaf: false\n"
            "      - label: lib\n"
            "        data: /usr/lib\n"
            "        children: [a.so]\n"
            "  - README\n");
        expect(roots.has_value()) << error_msg(roots);
        if (!roots) return;
        expect(roots->size() == 2_ul);

        auto& src = (*roots)[0];
        expect(src->label() == "src");
        expect(src->isExpanded());
        expect(src->children().size() == 3_ul);
        expect(src->children()[0]->isLeaf());
        expect(src->children()[1]->isLeaf()) << "no children means leaf";
        expect(!src->children()[2]->isExpanded());
        expect(getAs<std::string>(src->children()[2]->data()) == std::optional<std::string>("/usr/lib"));
        expect((*roots)[1]->isLeaf());

        auto flat = FlattenedView::build(*roots);
        expect(flat.size() == 5_ul) << "collapsed lib hides a.so";
    };

    "tree errors keep the failing path"_test = [] {
        auto roots = parseTreeDocument(
            "tree:\n"
            "  - label: ok\n"
            "    children:\n"
            "      - {expanded: true}\n");
        expect(!roots.has_value());
        if (!roots) return;
        expect(roots.error().code() == ErrorCode::Parse);
        expect(roots.error().to_string().find("tree/0/0") != std::string::npos) << roots.error().to_string();

        expect(!parseTreeDocument("tree:\n  - label: x\n    children: leafy\n").has_value());
        expect(!parseTreeDocument("items: [a]").has_value());
        expect(!parseTreeDocument("tree: [unterminated").has_value());
    };

    "missing file is an io error"_test = [] {
        auto content = loadDocumentFile("/nonexistent/yview/document.yaml");
        expect(!content.has_value());
        if (!content) {
            expect(content.error().code() == ErrorCode::Io);
        }
    };
};
