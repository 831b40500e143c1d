#pragma once
#include <tao/pegtl.hpp>

namespace fieldmeta::surface::pegtl_front::grammar {
using namespace tao::pegtl;

// Comments and whitespace
struct comment_line : seq< one<'#'>, until< eolf > > {};
struct space_or_comment : sor< space, comment_line > {};

template<typename Rule>
using ws = pad< Rule, space_or_comment >;

// tokens
struct ident_first : ranges<'a','z','A','Z','_','_'> {};
struct ident_rest : ranges<'a','z','A','Z','0','9','_','_'> {};
struct ident : seq< ident_first, star< ident_rest > > {};
template<char... Cs>
struct kw : seq< string<Cs...>, not_at< ident_rest > > {};
struct kw_struct : kw<'s','t','r','u','c','t'> {};
struct kw_metadata : seq< one<'@'>, kw<'m','e','t','a','d','a','t','a'> > {};
struct kw_chain : seq< one<'@'>, kw<'c','h','a','i','n'> > {};
struct comma : one<','> {};
struct bar : one<'|'> {};
struct colon : one<':'> {};
struct equal : one<'='> {};
struct lbrace : one<'{'> {};
struct rbrace : one<'}'> {};
struct lparen : one<'('> {};
struct rparen : one<')'> {};

// values
struct sign : one<'+','-'> {};
struct exponent : seq< one<'e','E'>, opt< sign >, plus< digit > > {};
struct number_lit : seq< opt< sign >, plus< digit >, opt< one<'.'>, star< digit > >, opt< exponent > > {};
struct string_body : star< sor< seq< one<'\\'>, any >, not_one<'"','\\'> > > {};
struct string_lit : seq< one<'"'>, must< string_body, one<'"'> > > {};
struct nothing_lit : kw<'n','o','t','h','i','n','g'> {};
struct true_lit : kw<'t','r','u','e'> {};
struct false_lit : kw<'f','a','l','s','e'> {};
struct ident_value : ident {};
struct value;
struct tuple_open : lparen {};
struct tuple_inner : seq< ws< value >, star< seq< ws< comma >, ws< value > > >, opt< ws< comma > > > {};
struct tuple : seq< tuple_open, must< star< space_or_comment >, opt< tuple_inner >, rparen > > {};
struct value : sor< tuple, string_lit, number_lit, nothing_lit, true_lit, false_lit, ident_value > {};

// types: Name or Name{T, ...}
struct type_expr;
struct type_head : ident {};
struct type_params : seq< lbrace, must< ws< type_expr >, star< seq< ws< comma >, ws< type_expr > > >, rbrace > > {};
struct type_expr : seq< type_head, opt< type_params > > {};

// fields: name (: Type)? (= value)? (| value)*
struct field_name : ident {};
struct type_ann : seq< ws< colon >, must< ws< type_expr > > > {};
struct default_ann : seq< ws< equal >, must< ws< value > > > {};
struct bar_ann : seq< ws< bar >, must< ws< value > > > {};
struct field : seq< field_name, opt< type_ann >, opt< default_ann >, star< bar_ann > > {};
struct body_open : lbrace {};
struct struct_body : seq< ws< body_open >, must< star< ws< field >, opt< ws< comma > > >, ws< rbrace > > > {};

struct struct_decl : seq< kw_struct, must< ws< type_expr >, struct_body > > {};
struct typed_block : seq< type_expr, must< struct_body > > {};

// top-level items
struct decl_name : ident {};
struct ext_ref : seq< one<'@'>, ident > {};
struct chain_link : seq< one<'@'>, ident > {};
struct metadata_item : seq< kw_metadata, must< ws< decl_name >, ws< value > > > {};
// Links stay on the @chain line so the next line's @ext is not swallowed.
struct chain_item : seq< kw_chain, must< plus< blank >, decl_name, plus< seq< star< blank >, chain_link > > > > {};
struct ext_item : seq< at< one<'@'> >, must< plus< ws< ext_ref > >, sor< struct_decl, typed_block > > > {};
struct struct_item : seq< struct_decl > {};
struct top_item : sor< metadata_item, chain_item, ext_item, struct_item > {};

struct module_rule : must< star< space_or_comment >, star< top_item, star< space_or_comment > >, eof > {};

} // namespace fieldmeta::surface::pegtl_front::grammar
