#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace page_model {

enum class ComponentType {
    // basic
    Button,
    Heading,
    Text,
    Paragraph,
    Image,
    Video,
    Icon,
    Spacer,
    Divider,
    Link,
    // layout
    Container,
    Section,
    Column,
    Row,
    Grid,
    Card,
    Hero,
    Sidebar,
    Header,
    Footer,
    // forms
    Form,
    Input,
    Textarea,
    Select,
    Checkbox,
    Radio,
    SubmitButton,
    FileUpload,
    // advanced
    Accordion,
    Tabs,
    Modal,
    Carousel,
    Slider,
    Gallery,
    Testimonial,
    PricingTable,
    ProgressBar,
    Countdown,
    SocialShare,
    Breadcrumbs,
    Pagination,
    Table,
    List,
    Blockquote,
    CodeBlock,
    Cta,
    FeatureBox,
    IconBox,
    TeamMember,
    BlogCard,
    ProductCard,
    SearchBar,
    Menu,
    GoogleMaps,
    SocialFeed,
    Unknown,
};

inline constexpr std::size_t component_type_count = static_cast<std::size_t>(ComponentType::Unknown) + 1;

// Kebab-case wire name ("submit-button", "pricing-table", ...).
std::string_view to_string(ComponentType type);
std::optional<ComponentType> component_type_from_string(std::string_view name);

const std::array<ComponentType, component_type_count>& all_component_types();

// Types whose recognized element owns its whole subtree in the IR.
bool absorbs_children(ComponentType type);
// Types that become section nodes at page level.
bool is_section_like(ComponentType type);
// Layout wrappers that keep their children as separate IR nodes.
bool is_layout_container(ComponentType type);

} // namespace page_model
