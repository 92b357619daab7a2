#include "xmprate/rating_select.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

namespace xmprate {
namespace {

    static std::string jpeg_with_xmp(std::string_view description)
    {
        std::string s("\xFF\xD8\xFF\xE1", 4);
        s.append("\x01\x00http://ns.adobe.com/xap/1.0/", 30);
        s.push_back('\0');
        s.append("<x:xmpmeta xmlns:x=\"adobe:ns:meta/\">\n"
                 " <rdf:RDF xmlns:rdf=\"http://www.w3.org/1999/02/22-rdf-syntax-ns#\">\n");
        s.append(description.data(), description.size());
        s.append(" </rdf:RDF>\n</x:xmpmeta>\n");
        s.append(2048, '\x5A');
        s.append("\xFF\xD9", 2);
        return s;
    }


    class SelectFile : public ::testing::Test {
    protected:
        void TearDown() override
        {
            if (!path_.empty()) {
                (void)std::remove(path_.c_str());
            }
        }

        const char* write(std::string_view bytes)
        {
            path_ = ::testing::TempDir();
            path_.append("xmprate_select_");
            path_.append(
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
            path_.append(".jpg");

            std::FILE* f = std::fopen(path_.c_str(), "wb");
            EXPECT_NE(f, nullptr);
            if (!f) {
                return path_.c_str();
            }
            const size_t n = bytes.empty()
                                 ? 0U
                                 : std::fwrite(bytes.data(), 1, bytes.size(), f);
            EXPECT_EQ(n, bytes.size());
            EXPECT_EQ(std::fclose(f), 0);
            return path_.c_str();
        }

        const char* write_rated(int rating, std::string_view label)
        {
            std::string d("  <rdf:Description rdf:about=\"\"\n"
                          "    xmlns:xmp=\"http://ns.adobe.com/xap/1.0/\"\n");
            d.append("    xmp:Rating=\"" + std::to_string(rating) + "\"");
            if (!label.empty()) {
                d.append("\n    xmp:Label=\"");
                d.append(label.data(), label.size());
                d.append("\"");
            }
            d.append("/>\n");
            return write(jpeg_with_xmp(d));
        }

        std::string path_;
    };


    TEST_F(SelectFile, SelectsByThreshold)
    {
        const char* path = write_rated(4, "");

        SelectOptions options;
        options.filter.threshold = 4;
        SelectResult r = select_file(path, options);
        EXPECT_EQ(r.action, SelectAction::Selected);
        EXPECT_EQ(r.rating, 4);
        EXPECT_FALSE(r.label.found);

        options.filter.threshold = 5;
        r = select_file(path, options);
        EXPECT_EQ(r.action, SelectAction::Rejected);
        EXPECT_TRUE(has_rating(r.action));
    }

    TEST_F(SelectFile, MatchingLabelIsSelected)
    {
        const char* path = write_rated(3, "Red");

        SelectOptions options;
        options.filter.threshold   = 3;
        options.filter.match_label = true;
        options.filter.label       = "Red";

        const SelectResult r = select_file(path, options);
        EXPECT_EQ(r.action, SelectAction::Selected);
        EXPECT_TRUE(r.label.found);
        EXPECT_EQ(r.label.value, "Red");
    }

    TEST_F(SelectFile, MismatchedLabelIsRejected)
    {
        const char* path = write_rated(5, "Green");

        SelectOptions options;
        options.filter.match_label = true;
        options.filter.label       = "Red";

        const SelectResult r = select_file(path, options);
        EXPECT_EQ(r.action, SelectAction::Rejected);
        EXPECT_EQ(r.label.value, "Green");
    }

    TEST_F(SelectFile, AbsentLabelIsRejected)
    {
        const char* path = write_rated(5, "");

        SelectOptions options;
        options.filter.match_label = true;
        options.filter.label       = "Red";

        EXPECT_EQ(select_file(path, options).action, SelectAction::Rejected);
    }

    TEST_F(SelectFile, InverseWithLabel)
    {
        const char* path = write_rated(5, "Green");

        SelectOptions options;
        options.filter.match_label = true;
        options.filter.label       = "Red";
        options.filter.inverse     = true;
        EXPECT_EQ(select_file(path, options).action, SelectAction::Selected);

        options.filter.label = "Green";
        EXPECT_EQ(select_file(path, options).action, SelectAction::Rejected);
    }

    TEST_F(SelectFile, MissingPacketIsSkippedUnlessReadAsZero)
    {
        std::string bytes("\xFF\xD8", 2);
        bytes.append(4096, '\x11');
        const char* path = write(bytes);

        SelectOptions options;
        options.filter.comparison = RatingComparison::LessEqual;
        options.filter.threshold  = 0;
        SelectResult r            = select_file(path, options);
        EXPECT_EQ(r.action, SelectAction::SkippedNotFound);
        EXPECT_FALSE(has_rating(r.action));

        options.missing_as_zero = true;
        r = select_file(path, options);
        EXPECT_EQ(r.action, SelectAction::Selected);
        EXPECT_EQ(r.rating, 0);

        // No packet means no label either.
        options.filter.match_label = true;
        options.filter.label       = "";
        EXPECT_EQ(select_file(path, options).action, SelectAction::Rejected);
    }

    TEST_F(SelectFile, MalformedRatingIsSkipped)
    {
        const char* path = write(jpeg_with_xmp(
            "  <rdf:Description xmp:Rating=\"\" xmp:Label=\"Red\"/>\n"));

        SelectOptions options;
        options.filter.threshold = 0;
        const SelectResult r     = select_file(path, options);
        EXPECT_EQ(r.action, SelectAction::SkippedMalformed);
        EXPECT_EQ(r.read.extract.line_number, 3U);
    }

    TEST(SelectFileMissing, OpenFailureIsSkipped)
    {
        std::string path = ::testing::TempDir();
        path.append("xmprate_select_missing.jpg");

        const SelectResult r = select_file(path.c_str(), SelectOptions {});
        EXPECT_EQ(r.action, SelectAction::SkippedIoError);
        EXPECT_EQ(r.read.scan.status, PacketScanStatus::OpenFailed);
    }

}  // namespace
}  // namespace xmprate
