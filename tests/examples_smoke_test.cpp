// Runs every examples/*.tl file through a session. A line "; => TEXT" after a
// form is the rendering that form must produce.
#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include "tlisp/session.hpp"

using namespace tlisp;

#ifdef TLISP_SOURCE_DIR

static std::vector<std::filesystem::path> example_files(){
    std::vector<std::filesystem::path> files;
    for(auto& entry : std::filesystem::directory_iterator(std::filesystem::path(TLISP_SOURCE_DIR)/"examples"))
        if(entry.path().extension() == ".tl") files.push_back(entry.path());
    std::sort(files.begin(), files.end());
    return files;
}

TEST(ExamplesSmokeTest, EveryExampleRendersAsDocumented){
    auto files = example_files();
    ASSERT_FALSE(files.empty());
    for(const auto& path : files){
        SCOPED_TRACE(path.filename().string());
        std::ifstream in(path);
        ASSERT_TRUE(in.good());
        std::ostringstream out;
        Session session(out, Options{});
        std::string line, last;
        size_t forms = 0;
        while(std::getline(in, line)){
            if(line.rfind("; => ", 0) == 0){
                EXPECT_EQ(last, line.substr(5));
                continue;
            }
            if(line.empty() || line[0] == ';') continue;
            auto r = session.run(line);
            EXPECT_TRUE(r.success) << line << ": " << r.error;
            last = Session::render(r);
            ++forms;
        }
        EXPECT_GT(forms, 0u);
    }
}

#endif
