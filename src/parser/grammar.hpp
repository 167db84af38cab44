#pragma once
#include <tao/pegtl.hpp>

namespace tlisp::pegtl_front::grammar {
using namespace tao::pegtl;

// Comments and whitespace
struct comment : seq< one<';'>, until< eolf > > {};
struct space_or_comment : sor< space, comment > {};
struct ws : star< space_or_comment > {};

struct symbol_char : sor< alnum, one<'+','-','*','/','<','>','=','!','&','|','_','?','.'> > {};
// Binding names may not look like numbers.
struct binding_name : seq< not_at< opt< one<'-'> >, digit >, plus< symbol_char > > {};

struct expr;

// Atoms
struct true_lit : seq< string<'t','r','u','e'>, not_at< symbol_char > > {};
struct false_lit : seq< string<'f','a','l','s','e'>, not_at< symbol_char > > {};
struct boolean : sor< true_lit, false_lit > {};

struct fraction : seq< one<'.'>, plus< digit > > {};
struct number_body : seq< opt< one<'-'> >, plus< digit >, opt< fraction > > {};
struct number_end : not_at< symbol_char > {};
struct number : seq< number_body, must< number_end > > {};

struct string_open : one<'"'> {};
struct escape_code : one<'"','\\','n','t','r'> {};
struct escape : seq< one<'\\'>, must< escape_code > > {};
struct plain_chars : plus< not_one<'"','\\'> > {};
struct string_content : star< sor< escape, plain_chars > > {};
struct string_close : one<'"'> {};
struct string_lit : seq< string_open, must< string_content, string_close > > {};

struct symbol : plus< symbol_char > {};

struct atom : sor< boolean, number, string_lit, symbol > {};

// Types: i32 | i64 | f64 | bool | String | _ | fn(T, ...) -> T
struct type;
struct base_type : seq< sor< string<'i','3','2'>, string<'i','6','4'>, string<'f','6','4'>,
                             string<'b','o','o','l'>, string<'S','t','r','i','n','g'>, one<'_'> >,
                        not_at< symbol_char > > {};
struct comma : one<','> {};
struct fn_type_open : seq< string<'f','n'>, ws, one<'('> > {};
struct fn_type_param : seq< type > {};
struct fn_type_params : opt< fn_type_param, ws, star< comma, ws, must< fn_type_param >, ws > > {};
struct fn_type_close : one<')'> {};
struct arrow : seq< string<'-','>'>, not_at< symbol_char > > {};
struct fn_type_arrow : seq< arrow > {};
struct fn_type_ret : seq< type > {};
struct fn_type : seq< fn_type_open, must< ws, fn_type_params, fn_type_close, ws, fn_type_arrow, ws, fn_type_ret > > {};
struct type : sor< fn_type, base_type > {};

// Parameters: [name: Type ...]
struct param_name : binding_name {};
struct param_colon : one<':'> {};
struct param_type : seq< type > {};
struct param : seq< param_name, ws, must< param_colon >, ws, must< param_type > > {};
struct params_open : one<'['> {};
struct params_close : one<']'> {};
struct params : seq< params_open, ws, star< param, ws >, must< params_close > > {};

// Lists. open_paren records the position; form_mark records the operand stack heights.
struct open_paren : one<'('> {};
struct form_mark : success {};
struct expr_start : sor< one<'(','"'>, symbol_char > {};

// (if cond then else)
struct kw_if : seq< string<'i','f'>, not_at< symbol_char > > {};
struct if_operand : seq< expr > {};
struct if_close : one<')'> {};
struct if_form : seq< kw_if, must< form_mark, ws, if_operand, ws, if_operand, ws, if_operand, ws, if_close > > {};

// (let name [:] [Type] value [body])
struct kw_let : seq< string<'l','e','t'>, not_at< symbol_char > > {};
struct let_name : binding_name {};
// a bare type only counts as an annotation when another expression follows it
struct let_type : seq< at< type, ws, expr_start >, type > {};
struct let_colon : one<':'> {};
struct let_annotation : sor< seq< let_colon, ws, opt< let_type > >, let_type > {};
struct let_value : seq< expr > {};
struct let_body : seq< expr > {};
struct let_close : one<')'> {};
struct let_form : seq< kw_let, must< form_mark, ws, let_name, ws, opt< let_annotation, ws >, let_value, ws, opt< let_body, ws >, let_close > > {};

// (defn name [params] -> Type body)
struct kw_defn : seq< string<'d','e','f','n'>, not_at< symbol_char > > {};
struct defn_name : binding_name {};
struct ret_arrow : seq< arrow > {};
struct ret_type : seq< type > {};
struct fn_body : seq< expr > {};
struct fn_close : one<')'> {};
struct defn_form : seq< kw_defn, must< form_mark, ws, defn_name, ws, params, ws, ret_arrow, ws, ret_type, ws, fn_body, ws, fn_close > > {};

// (fn [params] [-> Type] body), also spelled lambda
struct kw_fn : seq< sor< string<'l','a','m','b','d','a'>, string<'f','n'> >, not_at< symbol_char > > {};
struct opt_ret : seq< arrow, ws, must< ret_type > > {};
struct fn_form : seq< kw_fn, must< form_mark, ws, params, ws, opt< opt_ret, ws >, fn_body, ws, fn_close > > {};

// anything else is an application (or the empty list)
struct list_close : one<')'> {};
struct generic_list : seq< form_mark, star< expr, ws >, must< list_close > > {};

struct list_body : sor< if_form, let_form, defn_form, fn_form, generic_list > {};
struct list_form : seq< open_paren, ws, list_body > {};

struct expr : sor< list_form, atom > {};

struct top_expr : seq< expr > {};
struct file : seq< ws, must< top_expr >, ws, must< eof > > {};

} // namespace tlisp::pegtl_front::grammar
