#include "KeyMappings.h"
#include "Dimensions.h"
#include <cctype>
#include <cmath>
#include <cstring>
#include <set>

namespace reflection {

void KeyMappings::build(SessionRandom& rng)
{
    table_.clear();

    for (const char* p = kAlphabet; *p; ++p) {
        auto& list = table_[*p];
        int affected = 5 + rng.index(6);   // 5-10
        std::set<int> used;
        for (int i = 0; i < affected; ++i) {
            int dim;
            do {
                dim = rng.index(kDimensionCount);
            } while (used.count(dim));
            used.insert(dim);

            float direction = rng.sign();
            float strength = 0.02f + rng.uniform() * 0.05f;
            list.push_back({dim, strength * direction});
        }
    }

    const char* digits = "1234567890";
    for (int i = 0; i < (int)std::strlen(digits); ++i)
        table_[digits[i]].push_back({40 + (i % 12), 0.05f * (i % 2 == 0 ? 1.0f : -1.0f)});

    const char* top = "qwertyuiop";
    for (int i = 0; i < (int)std::strlen(top); ++i)
        table_[top[i]].push_back({i % 16, 0.04f * (float)((i % 3) - 1)});

    const char* home = "asdfghjkl";
    for (int i = 0; i < (int)std::strlen(home); ++i)
        table_[home[i]].push_back({16 + (i % 16), 0.04f * (std::sin((float)i) > 0.0f ? 1.0f : -1.0f)});

    const char* bottom = "zxcvbnm";
    for (int i = 0; i < (int)std::strlen(bottom); ++i)
        table_[bottom[i]].push_back({52 + (i % 12), 0.05f * ((float)(i % 2) - 0.5f) * 2.0f});
}

const std::vector<KeyInfluence>* KeyMappings::find(char key) const
{
    char lower = (char)std::tolower((unsigned char)key);
    auto it = table_.find(lower);
    return it != table_.end() ? &it->second : nullptr;
}

} // namespace reflection
