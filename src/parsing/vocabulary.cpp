#include <cvpipe/parsing/text_utils.h>
#include <cvpipe/parsing/vocabulary.h>

#include <cctype>

namespace cvpipe::parsing {

namespace {

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

} // namespace

const std::vector<std::string_view>& skillVocabulary() {
    static const std::vector<std::string_view> terms{
        "Python",      "Java",         "JavaScript", "TypeScript", "C++",        "C#",
        "SQL",         "HTML",         "CSS",        "React",      "Angular",    "Vue",
        "Node.js",     "Django",       "Flask",      "AWS",        "Azure",      "Docker",
        "Kubernetes",  "Git",          "Linux",      "Windows",    "macOS",      "Agile",
        "Scrum",       "Machine Learning", "AI",     "Data Science", "Analytics", "Pandas",
        "NumPy",       "TensorFlow",   "PyTorch",    "Rust",       "Terraform",  "GraphQL",
        "PostgreSQL",  "MySQL",        "MongoDB",    "Redis",      "CI/CD"};
    return terms;
}

const std::vector<std::pair<std::string_view, std::vector<std::string_view>>>& skillCategories() {
    static const std::vector<std::pair<std::string_view, std::vector<std::string_view>>>
        categories{
            {"programming",
             {"Python", "Java", "JavaScript", "TypeScript", "C++", "C#", "Go", "Rust", "PHP",
              "Ruby", "Swift", "Kotlin", "Scala", "R", "MATLAB", "SQL"}},
            {"web_development",
             {"HTML", "CSS", "React", "Angular", "Vue.js", "Node.js", "Express", "Django",
              "Flask", "Spring", "ASP.NET", "Laravel", "Next.js", "Nuxt.js"}},
            {"data_science",
             {"Machine Learning", "Deep Learning", "Data Analysis", "Statistics", "Pandas",
              "NumPy", "Scikit-learn", "TensorFlow", "PyTorch", "Keras", "Jupyter",
              "Matplotlib", "Seaborn", "Tableau", "Power BI"}},
            {"cloud_devops",
             {"AWS", "Azure", "Google Cloud", "Docker", "Kubernetes", "Jenkins", "Git", "CI/CD",
              "Terraform", "Ansible", "Linux", "Bash", "Monitoring"}},
            {"mobile",
             {"iOS", "Android", "React Native", "Flutter", "Xamarin", "Swift", "Kotlin",
              "Objective-C", "Mobile UI/UX"}},
            {"databases",
             {"MySQL", "PostgreSQL", "MongoDB", "Redis", "SQLite", "Oracle", "SQL Server",
              "Cassandra", "ElasticSearch", "Neo4j"}}};
    return categories;
}

const std::vector<std::pair<std::string_view, std::vector<std::string_view>>>& industryKeywords() {
    static const std::vector<std::pair<std::string_view, std::vector<std::string_view>>> keywords{
        {"technology",
         {"software development", "agile", "scrum", "microservices", "api", "automation",
          "testing", "debugging", "version control", "architecture"}},
        {"data",
         {"analytics", "visualization", "modeling", "algorithms", "big data", "etl",
          "data pipeline", "business intelligence", "reporting"}},
        {"management",
         {"leadership", "team management", "project management", "strategic planning",
          "stakeholder management", "budget management", "performance optimization"}}};
    return keywords;
}

bool containsTerm(std::string_view text, std::string_view term) {
    if (term.empty() || text.size() < term.size()) {
        return false;
    }
    const std::string haystack = toLower(text);
    const std::string needle = toLower(term);

    size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        bool leftOk = pos == 0 || !isWordChar(haystack[pos - 1]) || !isWordChar(needle.front());
        size_t end = pos + needle.size();
        bool rightOk =
            end >= haystack.size() || !isWordChar(haystack[end]) || !isWordChar(needle.back());
        // "C" must not match "C++" and "Java" must not match "JavaScript"
        if (leftOk && rightOk && end < haystack.size() && isWordChar(needle.back()) &&
            (haystack[end] == '+' || haystack[end] == '#')) {
            rightOk = false;
        }
        if (leftOk && rightOk) {
            return true;
        }
        pos = haystack.find(needle, pos + 1);
    }
    return false;
}

std::vector<std::string> findTerms(std::string_view text,
                                   const std::vector<std::string_view>& terms) {
    std::vector<std::string> found;
    for (auto term : terms) {
        if (containsTerm(text, term)) {
            pushUniqueCaseless(found, std::string(term));
        }
    }
    return found;
}

std::vector<std::string> findVocabularySkills(std::string_view text) {
    return findTerms(text, skillVocabulary());
}

} // namespace cvpipe::parsing
