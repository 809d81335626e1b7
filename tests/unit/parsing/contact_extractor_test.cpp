#include <gtest/gtest.h>

#include <cvpipe/parsing/field_extractors.h>
#include "../../common/test_helpers.h"

using namespace cvpipe::parsing;

namespace {

std::string digitsOf(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c >= '0' && c <= '9') {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace

TEST(ContactExtractorTest, FindsSingleEmailAndPhone) {
    ContactInfo contact;
    extractContact("Reach me at john@example.com or +1-415-555-0100 any weekday.", contact);

    ASSERT_TRUE(contact.email.has_value());
    EXPECT_EQ(*contact.email, "john@example.com");
    ASSERT_TRUE(contact.phone.has_value());
    EXPECT_EQ(digitsOf(*contact.phone), "14155550100");
}

TEST(ContactExtractorTest, NormalizesPhoneNumbers) {
    EXPECT_EQ(normalizePhone("(415) 555-0100"), "+14155550100");
    EXPECT_EQ(normalizePhone("1 415 555 0100"), "+14155550100");
    EXPECT_EQ(normalizePhone("+44 20 7946 0958"), "+44 20 7946 0958");
}

TEST(ContactExtractorTest, IgnoresDigitsInsideLongerNumbers) {
    ContactInfo contact;
    extractContact("Order 12345678901234567890 shipped", contact);
    EXPECT_FALSE(contact.phone.has_value());
}

TEST(ContactExtractorTest, ExtractsFullHeader) {
    ContactInfo contact;
    extractContact(cvpipe::test::sampleResumeText(), contact);

    EXPECT_EQ(contact.name, "Jane Doe");
    EXPECT_EQ(contact.email, "jane.doe@example.com");
    EXPECT_EQ(contact.phone, "+14155550100");
    EXPECT_EQ(contact.linkedin, "linkedin.com/in/janedoe");
    EXPECT_EQ(contact.city, "San Francisco");
    EXPECT_EQ(contact.state, "CA");
    EXPECT_EQ(contact.postalCode, "94105");
}

TEST(ContactExtractorTest, SeparatesProfileLinksFromWebsite) {
    ContactInfo contact;
    extractContact("https://github.com/janedoe\nhttps://janedoe.dev/blog", contact);
    EXPECT_EQ(contact.github, "https://github.com/janedoe");
    EXPECT_EQ(contact.website, "https://janedoe.dev/blog");
    EXPECT_FALSE(contact.linkedin.has_value());
}

TEST(ContactExtractorTest, KeepsFieldsAlreadySet) {
    ContactInfo contact;
    contact.email = "first@example.com";
    extractContact("second@example.com", contact);
    EXPECT_EQ(contact.email, "first@example.com");
}

TEST(ContactExtractorTest, NameSkipsHeadingsAndContactLines) {
    ContactInfo contact;
    extractContact("Summary\njane@example.com\nJohn Q Public\n", contact);
    EXPECT_EQ(contact.name, "John Q Public");
}

TEST(ContactExtractorTest, NoContactDataLeavesFieldsEmpty) {
    ContactInfo contact;
    extractContact("", contact);
    EXPECT_EQ(contact, ContactInfo{});
}
