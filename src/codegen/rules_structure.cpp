#include "bolt/codegen/rules.hpp"

namespace bolt::codegen {

void register_default_argument_parsers(RuleContext& ctx){
    static const char* const parsers[] = {
        "brigadier:bool",
        "brigadier:double",
        "brigadier:float",
        "brigadier:integer",
        "brigadier:long",
        "brigadier:string",
        "minecraft:angle",
        "minecraft:block_pos",
        "minecraft:block_predicate",
        "minecraft:block_state",
        "minecraft:color",
        "minecraft:column_pos",
        "minecraft:component",
        "minecraft:dimension",
        "minecraft:entity",
        "minecraft:entity_anchor",
        "minecraft:entity_summon",
        "minecraft:float_range",
        "minecraft:function",
        "minecraft:game_profile",
        "minecraft:int_range",
        "minecraft:item_enchantment",
        "minecraft:item_predicate",
        "minecraft:item_slot",
        "minecraft:item_stack",
        "minecraft:message",
        "minecraft:mob_effect",
        "minecraft:nbt_compound_tag",
        "minecraft:nbt_path",
        "minecraft:nbt_tag",
        "minecraft:objective",
        "minecraft:objective_criteria",
        "minecraft:operation",
        "minecraft:particle",
        "minecraft:resource_location",
        "minecraft:rotation",
        "minecraft:score_holder",
        "minecraft:scoreboard_slot",
        "minecraft:swizzle",
        "minecraft:team",
        "minecraft:time",
        "minecraft:uuid",
        "minecraft:vec2",
        "minecraft:vec3",
    };
    for(auto* p : parsers) ctx.argumentParsers.insert(p);
}

void register_structure_rules(CodegenVisitor& v, const std::shared_ptr<RuleContext>&){
    v.add_fallback([](CodegenVisitor& self, const node_ptr& n, Accumulator& acc) -> CompileResult {
        auto result = visit_generic(self, n, acc);
        if(!result) return std::nullopt;
        return Fragments{*result};
    }, "generic");

    v.add_rule(NodeKind::Root, [](CodegenVisitor& self, const node_ptr& n, Accumulator& acc) -> CompileResult {
        auto result = visit_generic(self, n, acc, CollectorKind::RootCommand);
        if(!result) return std::nullopt;
        return Fragments{*result};
    }, "root");
}

} // namespace bolt::codegen
