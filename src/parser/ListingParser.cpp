#include "ListingParser.hpp"
#include <lexbor/html/html.h>
#include <lexbor/dom/dom.h>
#include <algorithm>
#include <cctype>
#include <iterator>
#include <map>
#include <regex>
#include <sstream>
#include <stdexcept>
#include "../utils/UrlUtil.hpp"

namespace {

class HtmlDocument {
public:
    explicit HtmlDocument(const std::string& html) : document_(lxb_html_document_create()) {
        if (!document_) throw std::runtime_error("Failed to create HTML document");
        lxb_status_t status = lxb_html_document_parse(document_,
            reinterpret_cast<const lxb_char_t*>(html.data()), html.size());
        if (status != LXB_STATUS_OK) {
            lxb_html_document_destroy(document_);
            throw std::runtime_error("Failed to parse HTML");
        }
    }
    ~HtmlDocument() { lxb_html_document_destroy(document_); }

    HtmlDocument(const HtmlDocument&) = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;

    lxb_dom_node_t* root() const { return lxb_dom_interface_node(document_); }

private:
    lxb_html_document_t* document_;
};

std::string to_std_string(const lxb_char_t* lxb_str, size_t len) {
    if (lxb_str && len > 0) {
        return std::string(reinterpret_cast<const char*>(lxb_str), len);
    }
    return "";
}

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::string CollapseWhitespace(const std::string& s) {
    std::istringstream in(s);
    std::string word, out;
    while (in >> word) {
        if (!out.empty()) out.push_back(' ');
        out += word;
    }
    return out;
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : static_cast<char>(c);
    });
    return s;
}

std::string Attribute(lxb_dom_element_t* element, const std::string& key) {
    size_t len = 0;
    const lxb_char_t* value = lxb_dom_element_get_attribute(element,
        reinterpret_cast<const lxb_char_t*>(key.data()), key.size(), &len);
    return to_std_string(value, len);
}

bool HasAttribute(lxb_dom_element_t* element, const std::string& key) {
    return lxb_dom_element_has_attribute(element, reinterpret_cast<const lxb_char_t*>(key.data()), key.size());
}

std::string LocalName(lxb_dom_element_t* element) {
    size_t len = 0;
    const lxb_char_t* name = lxb_dom_element_local_name(element, &len);
    return to_std_string(name, len);
}

std::string Text(lxb_dom_element_t* element) {
    if (!element) return "";
    lxb_dom_node_t* node = lxb_dom_interface_node(element);
    size_t len = 0;
    lxb_char_t* text = lxb_dom_node_text_content(node, &len);
    std::string out = to_std_string(text, len);
    if (text) lxb_dom_document_destroy_text(node->owner_document, text);
    return Trim(out);
}

// Compound selector: tag, #id, .class and [attr] / [attr="value"] parts.
struct Compound {
    std::string tag;
    std::string id;
    std::vector<std::string> classes;
    std::vector<std::pair<std::string, std::optional<std::string>>> attributes;
};
// Descendant chain, outermost first.
using Selector = std::vector<Compound>;

Compound ParseCompound(const std::string& token) {
    Compound c;
    size_t i = 0;
    auto read_name = [&]() {
        size_t start = i;
        while (i < token.size() && token[i] != '.' && token[i] != '#' && token[i] != '[') ++i;
        return token.substr(start, i - start);
    };
    c.tag = read_name();
    while (i < token.size()) {
        char kind = token[i++];
        if (kind == '.') {
            c.classes.push_back(read_name());
        } else if (kind == '#') {
            c.id = read_name();
        } else if (kind == '[') {
            auto close = token.find(']', i);
            if (close == std::string::npos) throw std::invalid_argument("Unterminated attribute selector: " + token);
            std::string body = token.substr(i, close - i);
            i = close + 1;
            auto eq = body.find('=');
            if (eq == std::string::npos) {
                c.attributes.emplace_back(body, std::nullopt);
            } else {
                std::string value = body.substr(eq + 1);
                if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'')) {
                    value = value.substr(1, value.size() - 2);
                }
                c.attributes.emplace_back(body.substr(0, eq), value);
            }
        }
    }
    return c;
}

std::vector<Selector> ParseSelectorGroup(const std::string& text) {
    std::vector<Selector> group;
    std::stringstream alternatives(text);
    std::string alternative;
    while (std::getline(alternatives, alternative, ',')) {
        Selector chain;
        std::istringstream tokens(alternative);
        std::string token;
        while (tokens >> token) chain.push_back(ParseCompound(token));
        if (!chain.empty()) group.push_back(std::move(chain));
    }
    return group;
}

bool Matches(lxb_dom_element_t* element, const Compound& c) {
    if (!c.tag.empty() && LocalName(element) != c.tag) return false;
    if (!c.id.empty() && Attribute(element, "id") != c.id) return false;
    if (!c.classes.empty()) {
        std::istringstream in(Attribute(element, "class"));
        std::vector<std::string> present{std::istream_iterator<std::string>(in), std::istream_iterator<std::string>()};
        for (const auto& cls : c.classes) {
            if (std::find(present.begin(), present.end(), cls) == present.end()) return false;
        }
    }
    for (const auto& attr : c.attributes) {
        if (!HasAttribute(element, attr.first)) return false;
        if (attr.second && Attribute(element, attr.first) != *attr.second) return false;
    }
    return true;
}

bool MatchesChain(lxb_dom_node_t* node, const Selector& chain) {
    size_t i = chain.size() - 1;
    if (!Matches(lxb_dom_interface_element(node), chain[i])) return false;
    for (lxb_dom_node_t* p = node->parent; p && i > 0; p = p->parent) {
        if (p->type == LXB_DOM_NODE_TYPE_ELEMENT && Matches(lxb_dom_interface_element(p), chain[i - 1])) --i;
    }
    return i == 0;
}

// Elements under scope (excluding scope) matching the selector, in document order.
std::vector<lxb_dom_element_t*> SelectAll(lxb_dom_node_t* scope, const std::string& selector) {
    std::vector<lxb_dom_element_t*> found;
    if (!scope) return found;
    const auto group = ParseSelectorGroup(selector);

    lxb_dom_node_t* node = scope->first_child;
    while (node) {
        if (node->type == LXB_DOM_NODE_TYPE_ELEMENT) {
            for (const auto& chain : group) {
                if (MatchesChain(node, chain)) {
                    found.push_back(lxb_dom_interface_element(node));
                    break;
                }
            }
        }
        if (node->first_child) {
            node = node->first_child;
            continue;
        }
        while (node != scope && !node->next) node = node->parent;
        if (node == scope) break;
        node = node->next;
    }
    return found;
}

lxb_dom_element_t* SelectOne(lxb_dom_node_t* scope, const std::string& selector) {
    auto found = SelectAll(scope, selector);
    return found.empty() ? nullptr : found.front();
}

lxb_dom_node_t* AsNode(lxb_dom_element_t* element) {
    return lxb_dom_interface_node(element);
}

std::optional<std::string> NonEmpty(const std::string& s) {
    if (s.empty()) return std::nullopt;
    return s;
}

std::optional<int> ExtractInt(const std::string& text) {
    static const std::regex digits(R"((\d+))");
    std::smatch m;
    if (std::regex_search(text, m, digits)) {
        try {
            return std::stoi(m[1].str());
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<std::string> Lookup(const std::map<std::string, std::string>& data, const std::string& key) {
    auto it = data.find(key);
    if (it == data.end()) return std::nullopt;
    return it->second;
}

} // anonymous namespace

namespace Loopnet {

Address ListingParser::ParseAddress(const std::string& raw) {
    std::vector<std::string> parts;
    std::stringstream in(raw);
    std::string part;
    while (std::getline(in, part, ',')) parts.push_back(Trim(part));
    if (!raw.empty() && raw.back() == ',') parts.push_back("");

    Address result;
    if (parts.size() < 2) {
        result.address = Trim(raw);
        return result;
    }

    static const std::regex state_zip(R"(([A-Za-z]{2})\s*(\d{5})?)");
    const std::string& last = parts.back();
    std::smatch m;
    if (std::regex_search(last, m, state_zip)) {
        std::string state = m[1].str();
        std::transform(state.begin(), state.end(), state.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
        result.state = state;
        if (m[2].matched) result.zip_code = m[2].str();
    } else {
        result.state = last;
    }

    result.address = parts[0];
    // "Dallas, TX 75201" has no street; the first part is the city.
    result.city = parts.size() >= 3 ? parts[1] : parts[0];
    return result;
}

std::vector<PropertySummary> ListingParser::ParseSearchResults(const std::string& html, const std::string& base_url) {
    std::vector<PropertySummary> results;
    HtmlDocument document(html);

    static const std::regex size_re(R"(\d+\s*SF)", std::regex::icase);
    static const std::regex type_re(R"(\b(office|retail|industrial|apartment|land|hotel)\b)", std::regex::icase);

    for (auto* placard : SelectAll(document.root(), "article.placard")) {
        auto* title_tag = SelectOne(AsNode(placard), "header h4 a");
        if (!title_tag) continue;

        PropertySummary summary;
        summary.name = CollapseWhitespace(Text(title_tag));
        std::string href = Attribute(title_tag, "href");
        if (summary.name.empty() || href.empty()) continue;
        summary.url = UrlUtil::ResolveAgainst(base_url + "/", href);

        Address addr = ParseAddress(Text(SelectOne(AsNode(placard), "header a.subtitle-beta")));
        summary.address = addr.address;
        summary.city = addr.city;
        summary.state = addr.state;
        summary.zip_code = addr.zip_code;

        // <li name="Price">$2,800,000</li>; unlabeled items are classified by content.
        std::map<std::string, std::string> data_points;
        for (auto* li : SelectAll(AsNode(placard), "ul.data-points-2c li")) {
            std::string label = Attribute(li, "name");
            std::string value = Text(li);
            if (value.empty()) continue;
            if (!label.empty()) {
                data_points[label] = value;
            } else if (ToLower(value).find("cap rate") != std::string::npos) {
                data_points["Cap Rate"] = value;
            } else if (std::regex_search(value, size_re)) {
                data_points["Building Size"] = value;
            } else if (std::regex_search(value, type_re)) {
                data_points["Property Type"] = value;
            }
        }

        summary.price = Lookup(data_points, "Price");
        if (summary.price) {
            std::string lowered = ToLower(*summary.price);
            if (lowered == "upon request" || lowered == "negotiable" || lowered == "call for pricing") {
                summary.price.reset();
            }
        }
        summary.size_sqft = Lookup(data_points, "Building Size");
        summary.property_type = Lookup(data_points, "Property Type");

        auto* img = SelectOne(AsNode(placard), "img.image-hide");
        if (!img) img = SelectOne(AsNode(placard), ".slide img");
        if (img) summary.image_url = NonEmpty(Attribute(img, "src"));

        if (auto* logo = SelectOne(AsNode(placard), "[company-logo-carousel] img")) {
            summary.broker_company = NonEmpty(Attribute(logo, "alt"));
        }

        results.push_back(std::move(summary));
    }
    return results;
}

std::optional<int> ListingParser::ParseTotalResults(const std::string& html) {
    HtmlDocument document(html);
    auto* total = SelectOne(document.root(), ".total-results-digits, .result-count, .search-results-count");
    if (!total) return std::nullopt;

    static const std::regex count_re(R"(([\d,]+))");
    std::string text = Text(total);
    std::smatch m;
    if (!std::regex_search(text, m, count_re)) return std::nullopt;
    std::string digits;
    for (char c : m[1].str()) {
        if (c != ',') digits.push_back(c);
    }
    if (digits.empty()) return std::nullopt;
    try {
        return std::stoi(digits);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

bool ListingParser::HasNextPage(const std::string& html) {
    HtmlDocument document(html);
    return SelectOne(document.root(), "a[data-automation-id=\"NextPage\"]") != nullptr;
}

PropertyDetail ListingParser::ParsePropertyDetail(const std::string& html, const std::string& url) {
    HtmlDocument document(html);
    lxb_dom_node_t* root = document.root();
    PropertyDetail detail;
    detail.url = url;

    auto* name_el = SelectOne(root, ".profile-hero-main-title .profile-hero__segment");
    detail.name = name_el ? Text(name_el) : "Unknown";

    // The address segment carries a state abbreviation and usually a zip.
    static const std::regex state_zip_re(R"(\b[A-Z]{2}\s*\d{5}\b)");
    static const std::regex comma_state_re(R"(,\s*[A-Z]{2}\b)");
    auto subtitle_segments = SelectAll(root, ".profile-hero-sub-title .profile-hero__segment");
    std::vector<std::string> segment_texts;
    for (auto* seg : subtitle_segments) segment_texts.push_back(Text(seg));

    std::string raw_address;
    for (const auto& text : segment_texts) {
        if (std::regex_search(text, state_zip_re) || std::regex_search(text, comma_state_re)) {
            raw_address = text;
            break;
        }
    }
    if (raw_address.empty() && !segment_texts.empty()) raw_address = segment_texts.back();
    Address addr = ParseAddress(raw_address);
    detail.address = addr.address;
    detail.city = addr.city;
    detail.state = addr.state;
    detail.zip_code = addr.zip_code;

    if (auto* price_el = SelectOne(root, "td.feature-grid__data[data-fact-type=\"Price\"]")) {
        detail.price = Text(price_el);
    } else {
        for (const auto& text : segment_texts) {
            if (!text.empty() && text[0] == '$') {
                detail.price = Trim(text.substr(0, text.find('(')));
                break;
            }
        }
    }

    std::map<std::string, std::string> building_data;
    for (auto* row : SelectAll(root, "table.property-data tr.feature-grid__row")) {
        std::string label = Text(SelectOne(AsNode(row), "td.feature-grid__title"));
        auto* value_el = SelectOne(AsNode(row), "td.feature-grid__data");
        std::string value = Text(value_el);
        if (!label.empty() && !value.empty()) building_data[label] = value;
    }

    static const std::pair<const char*, const char*> kFactTypes[] = {
        {"BuildingSize", "Building Size"},
        {"YearBuilt", "Year Built"},
        {"BuildingClass", "Building Class"},
        {"Zoning", "Zoning"},
        {"LotSize", "Lot Size"},
        {"Parking", "Parking"},
        {"Stories", "Stories"},
        {"Units", "Units"},
        {"CapRate", "Cap Rate"},
        {"NOI", "NOI"},
        {"PropertyType", "Property Type"},
        {"PropertySubType", "Property Subtype"},
    };
    for (const auto& fact : kFactTypes) {
        if (building_data.count(fact.second)) continue;
        std::string selector = std::string("td.feature-grid__data[data-fact-type=\"") + fact.first + "\"]";
        if (auto* el = SelectOne(root, selector)) building_data[fact.second] = Text(el);
    }

    detail.size_sqft = Lookup(building_data, "Building Size");
    detail.year_built = Lookup(building_data, "Year Built");
    detail.building_class = Lookup(building_data, "Building Class");
    detail.zoning = Lookup(building_data, "Zoning");
    detail.lot_size = Lookup(building_data, "Lot Size");
    detail.parking = Lookup(building_data, "Parking");
    detail.cap_rate = Lookup(building_data, "Cap Rate");
    detail.noi = Lookup(building_data, "NOI");
    detail.property_type = Lookup(building_data, "Property Type");
    detail.property_subtype = Lookup(building_data, "Property Subtype");
    if (auto stories = Lookup(building_data, "Stories")) detail.stories = ExtractInt(*stories);
    if (auto units = Lookup(building_data, "Units")) detail.units = ExtractInt(*units);

    if (!detail.cap_rate || detail.cap_rate->empty()) {
        for (const auto& text : segment_texts) {
            if (ToLower(text).find("cap rate") != std::string::npos) {
                detail.cap_rate = text;
                break;
            }
        }
    }

    for (auto* li : SelectAll(root, ".highlights-wrap .bulleted-list li")) {
        detail.highlights.push_back(Text(li));
    }

    if (auto* desc = SelectOne(root, "section.description .sales-notes-text")) {
        detail.description = Text(desc);
    }

    for (auto* img : SelectAll(root, "#mosaic-profile .mosaic-tile img, .mosaic-carousel img")) {
        std::string src = Attribute(img, "src");
        if (!src.empty() && std::find(detail.images.begin(), detail.images.end(), src) == detail.images.end()) {
            detail.images.push_back(src);
        }
    }

    if (auto* contact = SelectOne(root, "ul.contacts li.contact")) {
        if (auto* contact_name = SelectOne(AsNode(contact), ".contact-name")) {
            auto* first = SelectOne(AsNode(contact_name), ".first-name");
            auto* last = SelectOne(AsNode(contact_name), ".last-name");
            detail.broker_name = (first && last) ? Text(first) + " " + Text(last) : Text(contact_name);
        }
    }
    if (auto* company = SelectOne(root, "ul.contacts .company-name")) {
        detail.broker_company = Text(company);
    }
    if (auto* phone = SelectOne(root, "a#broker-phone-number")) {
        detail.broker_phone = Text(phone);
    }

    return detail;
}

}
