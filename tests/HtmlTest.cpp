#include <gtest/gtest.h>

#include "../src/util/Html.hpp"

TEST(Html, EscapesMarkupCharacters) {
    EXPECT_EQ(Html::escape("<a href=\"x\">it's & more</a>"),
              "&lt;a href=&quot;x&quot;&gt;it&#x27;s &amp; more&lt;/a&gt;");
}

TEST(Html, LeavesPlainTextAlone) {
    EXPECT_EQ(Html::escape(""), "");
    EXPECT_EQ(Html::escape("PATH=/usr/bin:/bin"), "PATH=/usr/bin:/bin");
}

TEST(Html, EscapesExistingEntitiesAsText) {
    EXPECT_EQ(Html::escape("&amp;"), "&amp;amp;");
}
