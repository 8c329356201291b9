/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "Modules.hpp"
#include "XmlPatchReader.hpp"

#include <gtest/gtest.h>

#include <spdlog/sinks/ostream_sink.h>

namespace {
using namespace StdLib;
using ErrorKind = Patch::Error::Kind;

class XmlPatchReaderTest : public ::testing::Test {
protected:
    SharedPtr<ModuleRegistry> mModuleRegistry = std::make_shared<ModuleRegistry>();
    Xml::PatchReader mReader { mModuleRegistry };
};

TEST_F(XmlPatchReaderTest, ReadsOperationElementsInOrder) {
    auto operations = mReader.ParseOperations(fToByteStream(R"(<?xml version="1.0"?>
        <Patch>
            <!-- comments are not operations -->
            <Replace path="/Root/X" value="new"/>
            <Remove path="/Root/Y"/>
            <Add path="/Root"><Z/></Add>
            <Unknown/>
        </Patch>)"));
    ASSERT_TRUE(operations);
    const auto& list = operations.Value().Operations();
    ASSERT_EQ(list.size(), 4u);

    EXPECT_EQ(list[0].Name, "Replace");
    EXPECT_EQ(list[0].Path, Optional<String>("/Root/X"));
    EXPECT_EQ(list[0].Value, Optional<String>("new"));

    EXPECT_EQ(list[1].Name, "Remove");
    EXPECT_EQ(list[1].Path, Optional<String>("/Root/Y"));
    EXPECT_FALSE(list[1].Value.has_value());

    EXPECT_EQ(list[2].Name, "Add");
    ASSERT_NE(list[2].Node, nullptr);
    ASSERT_NE(list[2].Node->children, nullptr);
    EXPECT_STREQ(reinterpret_cast<const char*>(list[2].Node->children->name), "Z");

    // Validation happens when the operation is applied
    EXPECT_EQ(list[3].Name, "Unknown");
    EXPECT_FALSE(list[3].Path.has_value());
}

TEST_F(XmlPatchReaderTest, AcceptsPatchWithoutOperations) {
    auto operations = mReader.ParseOperations(fToByteStream("<Patch/>"));
    ASSERT_TRUE(operations);
    EXPECT_EQ(operations.Value().Count(), 0u);
}

TEST_F(XmlPatchReaderTest, RejectsMalformedPatch) {
    auto operations = mReader.ParseOperations(fToByteStream("<Patch><Remove path='/a'></Patch>"));
    ASSERT_FALSE(operations);
    EXPECT_EQ(operations.GetError().GetKind(), ErrorKind::MalformedPatch);
}

TEST_F(XmlPatchReaderTest, RejectsMalformedDocument) {
    for (const auto* xml : { "", "<Root>", "just text" }) {
        auto document = mReader.ParseDocument(fToByteStream(xml));
        ASSERT_FALSE(document) << xml;
        EXPECT_EQ(document.GetError().GetKind(), ErrorKind::MalformedDocument) << xml;
    }
}

TEST_F(XmlPatchReaderTest, LogsLongParserDiagnosticsInFull) {
    OStrStream logOutput;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(logOutput);
    sink->set_pattern("%v");
    auto loggerRegistry = std::make_shared<Log::LoggerRegistry>(spdlog::sinks_init_list{sink});
    loggerRegistry->RegisterModule(Module::Name::XML_ENGINE, spdlog::level::debug);
    auto moduleRegistry = std::make_shared<ModuleRegistry>();
    moduleRegistry->SetLoggerRegistry(loggerRegistry);

    Xml::PatchReader reader(moduleRegistry);
    const String longName(3000, 'A');
    auto document = reader.ParseDocument(fToByteStream("<" + longName + "></B>"));
    ASSERT_FALSE(document);
    EXPECT_NE(logOutput.str().find(longName + " line 1"), String::npos);
}

TEST_F(XmlPatchReaderTest, SerializesWithDeclarationAndIndentation) {
    auto document = mReader.ParseDocument(fToByteStream("<Root>\n  <X>value</X>\n</Root>"));
    ASSERT_TRUE(document);
    const auto serialized = fToString(mReader.SerializeDocument(*document.Value()));
    EXPECT_EQ(serialized, "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<Root>\n  <X>value</X>\n</Root>\n");
}

} // namespace
