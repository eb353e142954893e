// =============================================================================
// Model Tests
// =============================================================================

#include <gtest/gtest.h>
#include "ifc2lbd/error.hpp"
#include "ifc2lbd/model/model.hpp"
#include "ifc2lbd/schema_registry.hpp"

using namespace ifc2lbd;
using namespace ifc2lbd::model;

namespace {

Entity make_entity(EntityId id, const std::string& type, std::vector<Attribute> attrs = {}) {
    Entity e;
    e.id = id;
    e.type = type;
    e.attributes = std::move(attrs);
    return e;
}

} // namespace

class ModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 1 -> 2 -> 3 -> 4, 1 -> 5, 2 -> 99 (missing)
        model_.add(make_entity(1, "IfcWall", {{"Representation", make_ref(2)}, {"Tag", make_ref(5)}}));
        model_.add(make_entity(2, "IfcProductDefinitionShape",
                               {{"Representations", make_collection({make_ref(3), make_ref(99), make_ref(3)})}}));
        model_.add(make_entity(3, "IfcShapeRepresentation",
                               {{"Items", make_collection({make_typed("IfcLabel", make_ref(4))})}}));
        model_.add(make_entity(4, "IfcExtrudedAreaSolid"));
        model_.add(make_entity(5, "IfcSlab", {{"Name", "S1"}}));
    }

    Model model_{"IFC4"};
};

TEST_F(ModelTest, AddAndGet) {
    EXPECT_EQ(model_.size(), 5u);
    EXPECT_EQ(model_.schema_id(), "IFC4");
    ASSERT_NE(model_.get(3), nullptr);
    EXPECT_EQ(model_.get(3)->type, "IfcShapeRepresentation");
    EXPECT_EQ(model_.get(99), nullptr);
    EXPECT_FALSE(model_.contains(99));
}

TEST_F(ModelTest, AddRejectsBadRecords) {
    EXPECT_THROW(model_.add(make_entity(0, "IfcWall")), InvalidArgumentError);
    EXPECT_THROW(model_.add(make_entity(7, "")), InvalidArgumentError);
    EXPECT_THROW(model_.add(make_entity(1, "IfcDoor")), InvalidArgumentError);
    EXPECT_EQ(model_.get(1)->type, "IfcWall");
}

TEST_F(ModelTest, ReferencesAreDistinctAndPresent) {
    EXPECT_EQ(model_.references(1), (std::vector<EntityId>{2, 5}));
    EXPECT_EQ(model_.references(2), (std::vector<EntityId>{3}));
    EXPECT_EQ(model_.references(3), (std::vector<EntityId>{4}));
    EXPECT_TRUE(model_.references(4).empty());
}

TEST_F(ModelTest, Traverse) {
    EXPECT_EQ(model_.traverse(1), (std::vector<EntityId>{1, 2, 5, 3, 4}));
    EXPECT_EQ(model_.traverse(1, 1), (std::vector<EntityId>{1, 2, 5}));
    EXPECT_EQ(model_.traverse(1, 0), (std::vector<EntityId>{1}));
    EXPECT_EQ(model_.traverse(3), (std::vector<EntityId>{3, 4}));
    EXPECT_TRUE(model_.traverse(99).empty());
}

TEST_F(ModelTest, TraverseTerminatesOnCycles) {
    model_.add(make_entity(10, "A", {{"next", make_ref(11)}}));
    model_.add(make_entity(11, "B", {{"next", make_ref(10)}}));
    EXPECT_EQ(model_.traverse(10), (std::vector<EntityId>{10, 11}));
}

TEST_F(ModelTest, InverseIndex) {
    EXPECT_EQ(model_.inverse(2), (std::vector<EntityId>{1}));
    EXPECT_EQ(model_.inverse(4), (std::vector<EntityId>{3}));
    EXPECT_TRUE(model_.inverse(1).empty());

    model_.add(make_entity(6, "IfcAnnotation", {{"Item", make_ref(4)}}));
    EXPECT_EQ(model_.inverse(4), (std::vector<EntityId>{3, 6}));
}

TEST_F(ModelTest, ReferencersVia) {
    EXPECT_EQ(model_.referencers_via(2, "Representation"), (std::vector<EntityId>{1}));
    EXPECT_TRUE(model_.referencers_via(2, "Tag").empty());
    EXPECT_EQ(model_.referencers_via(5, "Tag"), (std::vector<EntityId>{1}));
}

TEST_F(ModelTest, SetAttributeNullUpdatesIndex) {
    model_.set_attribute_null(1, "Representation");
    EXPECT_TRUE(model_.get(1)->find("Representation")->is_null());
    EXPECT_TRUE(model_.inverse(2).empty());
    EXPECT_EQ(model_.references(1), (std::vector<EntityId>{5}));

    // Unknown attribute: no-op
    model_.set_attribute_null(1, "Missing");
    EXPECT_THROW(model_.set_attribute_null(99, "X"), InvalidArgumentError);
}

TEST_F(ModelTest, ByType) {
    auto registry = SchemaRegistry::from_yaml_string("T", R"(
entities:
  IfcProduct: {}
  IfcWall: { supertype: IfcProduct }
  IfcSlab: { supertype: IfcProduct }
)");
    EXPECT_EQ(model_.by_type("IfcWall"), (std::vector<EntityId>{1}));
    EXPECT_TRUE(model_.by_type("IfcProduct").empty());
    EXPECT_EQ(model_.by_type("IfcProduct", &registry), (std::vector<EntityId>{1, 5}));
}

TEST_F(ModelTest, RemoveStripsReferences) {
    model_.remove(4);
    EXPECT_FALSE(model_.contains(4));
    // typed value wrapping the reference went with it
    EXPECT_TRUE(model_.get(3)->find("Items")->as_collection()->items.empty());

    model_.remove(3);
    const auto& reps = model_.get(2)->find("Representations")->as_collection()->items;
    ASSERT_EQ(reps.size(), 1u);
    EXPECT_EQ(reps[0].as_reference()->id, 99u);
    EXPECT_TRUE(model_.references(2).empty());

    model_.remove(5);
    EXPECT_TRUE(model_.get(1)->find("Tag")->is_null());
    EXPECT_EQ(model_.references(1), (std::vector<EntityId>{2}));

    EXPECT_THROW(model_.remove(5), InvalidArgumentError);
}

TEST_F(ModelTest, RemoveDropsOutgoingIndexEntries) {
    model_.remove(1);
    EXPECT_TRUE(model_.inverse(2).empty());
    EXPECT_TRUE(model_.inverse(5).empty());
}

TEST_F(ModelTest, EntitiesKeepInsertionOrder) {
    model_.remove(2);
    auto entities = model_.entities();
    ASSERT_EQ(entities.size(), 4u);
    EXPECT_EQ(entities[0].id, 1u);
    EXPECT_EQ(entities[1].id, 3u);
    EXPECT_EQ(entities[3].id, 5u);
}

TEST_F(ModelTest, LoadDropsMalformedAndDuplicateRecords) {
    stream::MemoryEntityStream input({
        make_entity(1, "IfcWall"),
        make_entity(0, "IfcWall"),
        make_entity(2, ""),
        make_entity(1, "IfcSlab"),
        make_entity(3, "IfcSlab", {{"Host", make_ref(1)}}),
    }, "IFC2X3");

    std::size_t dropped = 0;
    Model loaded = Model::load(input, &dropped);
    EXPECT_EQ(loaded.schema_id(), "IFC2X3");
    EXPECT_EQ(loaded.size(), 2u);
    EXPECT_EQ(dropped, 3u);
    EXPECT_EQ(loaded.get(1)->type, "IfcWall");
    EXPECT_EQ(loaded.inverse(1), (std::vector<EntityId>{3}));
}
