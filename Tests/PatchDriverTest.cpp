/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "JsonPatchEngine.hpp"
#include "JsonPatchReader.hpp"
#include "PatchApi.hpp"
#include "PatchDriver.hpp"
#include "XmlPatchReader.hpp"

#include <gtest/gtest.h>

namespace {
using namespace StdLib;
using Json::JSON;
using ErrorKind = Patch::Error::Kind;

// Records every applied operation into the document, fails on operation named "fail"
class RecordingEngine : public Patch::IPatchEngine<Vector<String>, String> {
public:
    String Name() const override { return "Recording"; }
    String Describe(const String& operation) const override { return operation; }

    Optional<Patch::Error> Apply(Vector<String>& document, const String& operation) override {
        ++mCalls;
        if (operation == "fail") {
            return Patch::Error(ErrorKind::UnsupportedTarget, "Failure requested", operation);
        }

        document.push_back(operation);
        return {};
    }

    SizeT mCalls = 0;
};

class PatchDriverTest : public ::testing::Test {
protected:
    SharedPtr<ModuleRegistry> mModuleRegistry = std::make_shared<ModuleRegistry>();
};

TEST_F(PatchDriverTest, AppliesOperationsInOrder) {
    auto engine = std::make_shared<RecordingEngine>();
    Patch::PatchDriver<Vector<String>, String> driver(engine, mModuleRegistry);
    auto result = driver.Run({}, { "first", "second", "third" });
    ASSERT_TRUE(result);
    EXPECT_EQ(result.Value(), (Vector<String> { "first", "second", "third" }));
}

TEST_F(PatchDriverTest, StopsAtFirstFailingOperation) {
    auto engine = std::make_shared<RecordingEngine>();
    Patch::PatchDriver<Vector<String>, String> driver(engine, mModuleRegistry);
    Vector<String> document;
    auto error = driver.RunInPlace(document, { "first", "fail", "third" });
    ASSERT_TRUE(error);
    EXPECT_EQ(error->GetKind(), ErrorKind::UnsupportedTarget);
    ASSERT_TRUE(error->OperationIndex().has_value());
    EXPECT_EQ(error->OperationIndex().value(), 1u);
    // Nothing is rolled back and nothing after the failure runs
    EXPECT_EQ(document, Vector<String> { "first" });
    EXPECT_EQ(engine->mCalls, 2u);
}

TEST_F(PatchDriverTest, RunReportsErrorInsteadOfDocument) {
    auto engine = std::make_shared<RecordingEngine>();
    Patch::PatchDriver<Vector<String>, String> driver(engine, mModuleRegistry);
    auto result = driver.Run({}, { "fail" });
    ASSERT_FALSE(result);
    EXPECT_EQ(result.GetError().OperationIndex(), Optional<SizeT>(0));
    EXPECT_EQ(result.GetError().Describe(), "UnsupportedTargetError: Failure requested (path 'fail') (operation #0)");
}

TEST_F(PatchDriverTest, EmptyOperationListKeepsDocument) {
    auto result = Patch::ApplyJsonPatch(JSON::parse(R"({"a": 1})"), {});
    ASSERT_TRUE(result);
    EXPECT_EQ(result.Value(), JSON::parse(R"({"a": 1})"));
}

TEST_F(PatchDriverTest, AppliesJsonPatch) {
    Json::PatchReader reader(mModuleRegistry);
    auto operations = reader.ParseOperations(fToByteStream(R"([
        { "op": "add", "path": "/a/c", "value": 2 },
        { "op": "add", "path": "/list/-", "value": 4 },
        { "op": "add", "path": "/list/0", "value": 0 },
        { "op": "replace", "path": "/a/b", "value": 5 },
        { "op": "remove", "path": "/gone" }
    ])"));
    ASSERT_TRUE(operations);

    auto result = Patch::ApplyJsonPatch(JSON::parse(R"({"a": {"b": 1}, "list": [1, 2, 3], "gone": true})"),
        operations.Value(), mModuleRegistry);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.Value(), JSON::parse(R"({"a": {"b": 5, "c": 2}, "list": [0, 1, 2, 3, 4]})"));
}

TEST_F(PatchDriverTest, JsonPatchFailureLeavesEarlierOperationsApplied) {
    Vector<Json::PatchOperation> operations {
        { Patch::OpKind::Add, "/a/c", JSON(2) },
        { Patch::OpKind::Replace, "/a/z", JSON(5) },
        { Patch::OpKind::Add, "/a/d", JSON(3) },
    };

    Patch::PatchDriver<JSON, Json::PatchOperation> driver(std::make_shared<Json::PatchEngine>(mModuleRegistry), mModuleRegistry);
    auto document = JSON::parse(R"({"a": {"b": 1}})");
    auto error = driver.RunInPlace(document, operations);
    ASSERT_TRUE(error);
    EXPECT_EQ(error->GetKind(), ErrorKind::KeyNotFound);
    EXPECT_EQ(error->Path(), "/a/z");
    EXPECT_EQ(error->OperationIndex(), Optional<SizeT>(1));
    EXPECT_EQ(document, JSON::parse(R"({"a": {"b": 1, "c": 2}})"));

    auto result = Patch::ApplyJsonPatch(JSON::parse(R"({"a": {"b": 1}})"), operations, mModuleRegistry);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.GetError().GetKind(), ErrorKind::KeyNotFound);
}

TEST_F(PatchDriverTest, AppliesXmlPatch) {
    Xml::PatchReader reader(mModuleRegistry);
    auto document = reader.ParseDocument(fToByteStream(
        "<User><Name>old</Name><Phones><Phone>1</Phone></Phones><Legacy/></User>"));
    ASSERT_TRUE(document);
    auto operations = reader.ParseOperations(fToByteStream(R"(<Patch>
        <Replace path="/User/Name" value="new"/>
        <Add path="/User/Phones"><Phone>2</Phone><Phone>3</Phone></Add>
        <Remove path="/User/Legacy"/>
        <Remove path="/User/DoesNotExist"/>
    </Patch>)"));
    ASSERT_TRUE(operations);

    auto result = Patch::ApplyXmlPatch(std::move(document).Value(), operations.Value(), mModuleRegistry);
    ASSERT_TRUE(result);
    EXPECT_EQ(fToString(reader.SerializeDocument(*result.Value())),
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<User>\n"
        "  <Name>new</Name>\n"
        "  <Phones>\n"
        "    <Phone>1</Phone>\n"
        "    <Phone>2</Phone>\n"
        "    <Phone>3</Phone>\n"
        "  </Phones>\n"
        "</User>\n");
}

TEST_F(PatchDriverTest, XmlPatchStopsAtMalformedOperation) {
    Xml::PatchReader reader(mModuleRegistry);
    auto document = reader.ParseDocument(fToByteStream("<Root><X>old</X><Y/></Root>"));
    ASSERT_TRUE(document);
    auto operations = reader.ParseOperations(fToByteStream(
        R"(<Patch><Replace path="/Root/X" value="new"/><Replace path="/Root/X"/><Remove path="/Root/Y"/></Patch>)"));
    ASSERT_TRUE(operations);

    Patch::PatchDriver<Xml::DocumentPtr, Xml::PatchOperation> driver(std::make_shared<Xml::PatchEngine>(mModuleRegistry), mModuleRegistry);
    auto patched = std::move(document).Value();
    auto error = driver.RunInPlace(patched, operations.Value().Operations());
    ASSERT_TRUE(error);
    EXPECT_EQ(error->GetKind(), ErrorKind::MissingValue);
    EXPECT_EQ(error->OperationIndex(), Optional<SizeT>(1));

    // First replace stays applied and the remove never ran
    xmlNode* root = xmlDocGetRootElement(patched.get());
    Xml::XmlCharPtr text(xmlNodeGetContent(root->children));
    EXPECT_EQ(Xml::fXmlCharToString(text.get()), "new");
    ASSERT_NE(root->children->next, nullptr);
    EXPECT_STREQ(reinterpret_cast<const char*>(root->children->next->name), "Y");
}

} // namespace
