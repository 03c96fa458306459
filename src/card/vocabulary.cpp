#include "card/vocabulary.hpp"

#include <stdexcept>

namespace pjsk::card {

auto VocabularyGroups::builtin() -> VocabularyGroups {
    VocabularyGroups groups;
    groups.commands = {
        {CMD_TEXT, {"文本", "文字", "内容", "text", "message"}},
        {CMD_FONT_SIZE, {"字号", "字体", "字", "font", "fontsize", "font-size"}},
        {CMD_LINE_SPACING, {"行距", "间距", "行间距", "spacing", "lines"}},
        {CMD_CURVE, {"曲线", "弧线", "曲线模式", "curve"}},
        {CMD_POSITION, {"位置", "坐标", "offset", "pos"}},
        {CMD_ROLE, {"人物", "角色", "立绘", "role", "avatar"}},
    };
    groups.size_variants = {
        {"increase", {"大", "增", "加", "+", "increase", "up", "plus"}},
        {"decrease", {"小", "减", "降", "-", "decrease", "down", "minus"}},
    };
    groups.curve_variants = {
        {"on", {"开", "开启", "on", "true", "enable"}},
        {"off", {"关", "关闭", "off", "false", "disable"}},
        {"toggle", {"切换", "toggle", "switch"}},
    };
    groups.directions = {
        {"up", {"上", "up", "u", "↑"}},
        {"down", {"下", "down", "d", "↓"}},
        {"left", {"左", "left", "l", "←"}},
        {"right", {"右", "right", "r", "→"}},
    };
    groups.list_subcommands = {
        {LIST_ALL, {"全部", "所有", "all"}},
        {LIST_GROUPS, {"角色分类", "分类", "groups"}},
        {LIST_EXPAND, {"展开指定角色", "展开", "expand"}},
    };
    return groups;
}

auto CommandVocabulary::build(const VocabularyGroups& groups)
    -> Result<CommandVocabulary, AliasConflict> {
    CommandVocabulary vocab;
    const std::pair<const AliasGroups*, AliasTable*> tables[] = {
        {&groups.commands, &vocab.commands},
        {&groups.size_variants, &vocab.size_variants},
        {&groups.curve_variants, &vocab.curve_variants},
        {&groups.directions, &vocab.directions},
        {&groups.list_subcommands, &vocab.list_subcommands},
    };
    for (const auto& [source, target] : tables) {
        auto built = AliasTable::build(*source);
        if (is_err(built)) {
            return unwrap_err(built);
        }
        *target = std::move(unwrap(built));
    }
    return vocab;
}

auto CommandVocabulary::builtin() -> CommandVocabulary {
    auto built = build(VocabularyGroups::builtin());
    if (is_err(built)) {
        throw std::logic_error("built-in vocabulary is ambiguous: " + unwrap_err(built).to_string());
    }
    return std::move(unwrap(built));
}

} // namespace pjsk::card
