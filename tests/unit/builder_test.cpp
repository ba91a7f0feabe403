#include <flex_widgets/builder.hpp>
#include <cell_surface/surface.hpp>

#include <gtest/gtest.h>

using flex_model::Direction;
using flex_model::ItemDesc;
using flex_model::NodeDesc;
using flex_model::Rect;
using flex_widgets::BuiltLayout;
using flex_widgets::VisibleFlex;

namespace {

NodeDesc panel_node(const std::string& id, const std::string& label = {}) {
    NodeDesc node;
    node.kind = NodeDesc::Kind::Panel;
    node.id = id;
    node.label = label;
    return node;
}

NodeDesc flex_node(const std::string& id, Direction direction) {
    NodeDesc node;
    node.kind = NodeDesc::Kind::Flex;
    node.id = id;
    node.direction = direction;
    return node;
}

ItemDesc item(NodeDesc content, int fixed_size, int proportion, std::vector<std::size_t> consumers = {}) {
    ItemDesc desc;
    desc.content = std::move(content);
    desc.fixed_size = fixed_size;
    desc.proportion = proportion;
    desc.consumers = std::move(consumers);
    return desc;
}

// root (along height): body (along width: files -> editor, editor hidden), status fixed 1
NodeDesc sample_document() {
    NodeDesc editor = panel_node("editor", "Editor");
    editor.hidden = true;

    NodeDesc body = flex_node("body", Direction::AlongWidth);
    body.items.push_back(item(panel_node("files"), 0, 1, {1}));
    body.items.push_back(item(editor, 0, 3));

    NodeDesc root = flex_node("root", Direction::AlongHeight);
    root.items.push_back(item(body, 0, 1));
    root.items.push_back(item(panel_node("status", "ready"), 1, 0));
    return root;
}

void draw(BuiltLayout& built, const Rect& area) {
    cell_surface::CellSurface surface(area.width, area.height);
    built.root->set_rect(area);
    built.root->draw(surface);
}

} // namespace

TEST(BuilderTest, BuildsTreeAndIndexes) {
    BuiltLayout built = flex_widgets::build_layout(sample_document());

    auto root = std::dynamic_pointer_cast<VisibleFlex>(built.root);
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->direction(), Direction::AlongHeight);
    ASSERT_EQ(root->container().registry().size(), 2u);
    EXPECT_EQ(root->container().registry().entries()[1].item.fixed_size, 1);

    auto body = std::dynamic_pointer_cast<VisibleFlex>(root->container().registry().entries()[0].item.content);
    ASSERT_NE(body, nullptr);
    EXPECT_EQ(body->direction(), Direction::AlongWidth);
    EXPECT_EQ(body->container().registry().entries()[0].consumers, std::vector<std::size_t>({1}));

    EXPECT_EQ(built.toggle_ids, std::vector<std::string>({"root", "body", "files", "editor", "status"}));
    ASSERT_EQ(built.panels.size(), 3u);
    // Label falls back to the id.
    EXPECT_EQ(built.panels[0].panel->label(), "files");
    EXPECT_EQ(built.panels[1].panel->label(), "Editor");
    ASSERT_EQ(built.panels[0].ancestors.size(), 2u);
    EXPECT_EQ(built.panels[0].ancestors[0], root);
    EXPECT_EQ(built.panels[0].ancestors[1], body);
    EXPECT_EQ(built.panels[2].ancestors.size(), 1u);
}

TEST(BuilderTest, HiddenFlagSetsInitialToggleState) {
    BuiltLayout built = flex_widgets::build_layout(sample_document());
    ASSERT_NE(built.find_toggle("editor"), nullptr);
    EXPECT_FALSE(built.find_toggle("editor")->is_shown());
    EXPECT_TRUE(built.find_toggle("files")->is_shown());
    EXPECT_EQ(built.find_toggle("missing"), nullptr);
    EXPECT_FALSE(built.is_shown(built.panels[1]));
}

TEST(BuilderTest, TogglesDriveLayout) {
    BuiltLayout built = flex_widgets::build_layout(sample_document());
    const auto& files = built.panels[0].panel;
    const auto& editor = built.panels[1].panel;
    const auto& status = built.panels[2].panel;

    // Editor starts hidden and names no consumers, so its share is left empty.
    draw(built, Rect{0, 0, 40, 11});
    EXPECT_EQ(files->rect(), (Rect{0, 0, 10, 10}));
    EXPECT_EQ(status->rect(), (Rect{0, 10, 40, 1}));

    built.find_toggle("editor")->toggle();
    draw(built, Rect{0, 0, 40, 11});
    EXPECT_EQ(files->rect(), (Rect{0, 0, 10, 10}));
    EXPECT_EQ(editor->rect(), (Rect{10, 0, 30, 10}));

    built.find_toggle("files")->toggle();
    draw(built, Rect{0, 0, 40, 11});
    EXPECT_EQ(editor->rect(), (Rect{0, 0, 40, 10}));
}

TEST(BuilderTest, HiddenAncestorHidesPanel) {
    BuiltLayout built = flex_widgets::build_layout(sample_document());
    EXPECT_TRUE(built.is_shown(built.panels[0]));
    built.find_toggle("body")->set(false);
    EXPECT_FALSE(built.is_shown(built.panels[0]));
    EXPECT_TRUE(built.is_shown(built.panels[2]));
}

TEST(BuilderTest, MinimumSizeCombinesWithToggle) {
    NodeDesc narrow = panel_node("narrow");
    narrow.min_width = 12;
    NodeDesc root = flex_node("root", Direction::AlongWidth);
    root.items.push_back(item(narrow, 0, 1, {1}));
    root.items.push_back(item(panel_node("wide"), 0, 1));

    BuiltLayout built = flex_widgets::build_layout(root);
    const auto& panel = built.panels[0].panel;

    draw(built, Rect{0, 0, 20, 3});
    EXPECT_FALSE(panel->visible());
    EXPECT_EQ(built.panels[1].panel->rect(), (Rect{0, 0, 20, 3}));

    draw(built, Rect{0, 0, 30, 3});
    EXPECT_TRUE(panel->visible());
    built.find_toggle("narrow")->set(false);
    EXPECT_FALSE(panel->visible());
}

TEST(BuilderTest, DuplicateIdsShareOneToggle) {
    NodeDesc root = flex_node("", Direction::AlongWidth);
    root.items.push_back(item(panel_node("x", "first"), 0, 1));
    root.items.push_back(item(panel_node("x", "second"), 0, 1));

    BuiltLayout built = flex_widgets::build_layout(root);
    EXPECT_EQ(built.toggle_ids, std::vector<std::string>({"x"}));
    built.find_toggle("x")->set(false);
    EXPECT_FALSE(built.panels[0].panel->visible());
    EXPECT_FALSE(built.panels[1].panel->visible());
}

TEST(BuilderTest, AnonymousHiddenNodeStaysHidden) {
    NodeDesc hidden = panel_node("");
    hidden.hidden = true;
    NodeDesc root = flex_node("", Direction::AlongWidth);
    root.items.push_back(item(hidden, 0, 1));

    BuiltLayout built = flex_widgets::build_layout(root);
    EXPECT_TRUE(built.toggles.empty());
    EXPECT_FALSE(built.panels[0].panel->visible());
}

TEST(BuilderTest, SpacersBecomeEmptyItems) {
    NodeDesc root = flex_node("root", Direction::AlongWidth);
    root.items.push_back(item(NodeDesc{}, 0, 1, {1}));
    root.items.push_back(item(panel_node("p"), 0, 1));

    BuiltLayout built = flex_widgets::build_layout(root);
    auto flex = std::dynamic_pointer_cast<VisibleFlex>(built.root);
    ASSERT_NE(flex, nullptr);
    const auto& entries = flex->container().registry().entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].item.content, nullptr);
    EXPECT_TRUE(entries[0].consumers.empty());

    draw(built, Rect{0, 0, 10, 2});
    EXPECT_EQ(built.panels[0].panel->rect(), (Rect{5, 0, 5, 2}));
}

TEST(BuilderTest, SpacerRootBuildsNothing) {
    BuiltLayout built = flex_widgets::build_layout(NodeDesc{});
    EXPECT_EQ(built.root, nullptr);
    EXPECT_TRUE(built.panels.empty());
}
